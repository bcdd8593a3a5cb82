#include "modes.hpp"

#include <iostream>
#include <string>

/*
  CLI entry point.

  Modes:
    - compose : one channel pair -> one labeled row figure.
    - montage : several channel pairs -> rows stacked into one image.
*/
static void print_usage() {
    std::cout
        << "Usage:\n"
        << "  montager-cli compose --ch1=a.tif --ch2=b.tif [--label=TEXT] [--first] [--save=row.png] [--view]\n"
        << "  montager-cli montage --pairs=a1.tif,b1.tif,... [--labels=L1,...] [--gap=10] [--threads=N]\n"
        << "                       [--save=montage.png] [--view]\n"
        << "Config flags (both modes):\n"
        << "  --size=494x246 --intensity=200 --randomness=0.05 --clip=25 --padding=10 --stride=4\n"
        << "  --columns=\"Channel 1,Channel 2,Merge\" --font=sans-serif --rowfont=24 --colfont=24\n"
        << "  --nolabels --seed=N (0 = random)\n";
}

int main(int argc, char** argv)
{
    if (argc < 2) { print_usage(); return 0; }
    const std::string mode = argv[1];

    if      (mode == "compose") return run_compose(argc, argv);
    else if (mode == "montage") return run_montage(argc, argv);

    std::cout << "Unknown mode: " << mode << "\n";
    print_usage();
    return 1;
}
