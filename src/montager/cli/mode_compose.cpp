#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "montager/core/Pipeline.hpp"
#include "montager/core/Random.hpp"
#include "montager/io/TiffDecoder.hpp"

#include <iostream>
#include <string>

int run_compose(int argc, char** argv) {
    const std::string ch1Path = argValue(argc, argv, "ch1", "");
    const std::string ch2Path = argValue(argc, argv, "ch2", "");
    const std::string label   = argValue(argc, argv, "label", "");
    const std::string save    = argValue(argc, argv, "save", "row.png");
    const bool first          = argHas(argc, argv, "first");
    const bool withView       = argHas(argc, argv, "view");
    const int seed            = argValueInt(argc, argv, "seed", 0);

    if (ch1Path.empty() || ch2Path.empty()) {
        std::cerr
            << "[compose] usage:\n"
            << "  montager-cli compose --ch1=a.tif --ch2=b.tif [--label=TEXT] [--first]\n"
            << "                       [--save=row.png] [--view] [--seed=N] [config flags]\n";
        return 1;
    }

    const montager::ProcessingConfig cfg = config_from_args(argc, argv);
    std::cout << "[compose] " << describe(cfg) << "\n";

    try {
        const montager::Raster ch1 = montager::readTiffFile(ch1Path);
        const montager::Raster ch2 = montager::readTiffFile(ch2Path);
        std::cout << "[compose] ch1 " << ch1.width() << "x" << ch1.height()
                  << ", ch2 " << ch2.width() << "x" << ch2.height() << "\n";

        montager::MersenneRandomSource random(static_cast<unsigned>(seed));
        const montager::Raster row = montager::composeRow(ch1, ch2, cfg, label, first, random);

        if (withView) show_raster(row, "montager: row");
        if (!save_raster_png(row, save)) return 1;
    } catch (const std::exception& e) {
        std::cerr << "[compose] error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
