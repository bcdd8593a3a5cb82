#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "montager/compose/Montage.hpp"
#include "montager/core/Pipeline.hpp"
#include "montager/core/Random.hpp"
#include "montager/io/TiffDecoder.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// ---------------- helpers ----------------

namespace {

struct RowJob {
    std::string ch1, ch2, label;
};

struct RowOutcome {
    std::optional<montager::Raster> figure;
    std::string error;   // set when the row was skipped
};

// One row: decode both channels and compose. Failures stay inside the row.
void compose_one(const RowJob& job, std::size_t index, bool isFirst,
                 const montager::ProcessingConfig& cfg, unsigned seed,
                 RowOutcome& out)
{
    try {
        const montager::Raster ch1 = montager::readTiffFile(job.ch1);
        const montager::Raster ch2 = montager::readTiffFile(job.ch2);
        // distinct stream per row when seeded; 0 keeps it random
        montager::MersenneRandomSource random(seed ? seed + static_cast<unsigned>(index) : 0u);
        out.figure = montager::composeRow(ch1, ch2, cfg, job.label, isFirst, random);
    } catch (const std::exception& e) {
        out.error = e.what();
    }
}

} // namespace

// ---------------- main mode ----------------

int run_montage(int argc, char** argv)
{
    const std::string pairs  = argValue(argc, argv, "pairs", "");
    const std::string labels = argValue(argc, argv, "labels", "");
    const std::string save   = argValue(argc, argv, "save", "montage.png");
    const int gap            = std::max(0, argValueInt(argc, argv, "gap", 10));
    const int threadsArg     = argValueInt(argc, argv, "threads", 0);   // 0 = auto
    const int seed           = argValueInt(argc, argv, "seed", 0);
    const bool withView      = argHas(argc, argv, "view");

    const auto files = pairs.empty() ? std::vector<std::string>{} : splitCommas(pairs);
    if (files.empty() || files.size() % 2 != 0) {
        std::cerr
            << "[montage] usage:\n"
            << "  montager-cli montage --pairs=a1.tif,b1.tif[,a2.tif,b2.tif...] [--labels=L1,L2,...]\n"
            << "                       [--gap=10] [--threads=N] [--seed=N] [--save=montage.png] [--view]\n"
            << "                       [config flags]\n";
        return 1;
    }

    const auto labelList = labels.empty() ? std::vector<std::string>{} : splitCommas(labels);
    std::vector<RowJob> jobs;
    for (std::size_t i = 0; i + 1 < files.size(); i += 2) {
        const std::size_t r = i / 2;
        jobs.push_back({files[i], files[i + 1], r < labelList.size() ? labelList[r] : std::string{}});
    }

    const montager::ProcessingConfig cfg = config_from_args(argc, argv);
    std::cout << "[montage] rows=" << jobs.size() << ", " << describe(cfg) << "\n";

    unsigned workers = threadsArg > 0 ? static_cast<unsigned>(threadsArg)
                                      : std::max(1u, std::thread::hardware_concurrency());
    workers = std::min<unsigned>(workers, static_cast<unsigned>(jobs.size()));

    // ---------- compose rows in parallel ----------
    // Rows share nothing but the read-only config; each writes its own outcome slot.
    std::vector<RowOutcome> outcomes(jobs.size());
    std::atomic<std::size_t> nextRow{0};
    const auto t0 = std::chrono::steady_clock::now();

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (unsigned w = 0; w < workers; ++w) {
        pool.emplace_back([&]() {
            for (std::size_t i = nextRow++; i < jobs.size(); i = nextRow++) {
                compose_one(jobs[i], i, i == 0, cfg, static_cast<unsigned>(seed), outcomes[i]);
            }
        });
    }
    for (auto& t : pool) t.join();

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - t0).count();
    std::cout << "[montage] composed in " << ms << " ms on " << workers << " thread(s)\n";

    // ---------- collect, skipping failed rows ----------
    std::vector<montager::Raster> rows;
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        const std::string name = jobs[i].label.empty() ? ("#" + std::to_string(i)) : jobs[i].label;
        if (outcomes[i].figure) {
            std::cout << "[montage] row " << name << ": "
                      << outcomes[i].figure->width() << "x" << outcomes[i].figure->height() << "\n";
            rows.push_back(std::move(*outcomes[i].figure));
        } else {
            std::cerr << "[montage] row " << name << " skipped: " << outcomes[i].error << "\n";
        }
    }

    if (rows.empty()) {
        std::cerr << "[montage] no complete rows to save\n";
        return 1;
    }

    try {
        const montager::Raster montage = montager::stackRows(rows, gap);
        if (withView) show_raster(montage, "montager: montage");
        if (!save_raster_png(montage, save)) return 1;
    } catch (const std::exception& e) {
        std::cerr << "[montage] error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
