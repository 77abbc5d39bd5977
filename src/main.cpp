#include <iostream>
#include <string>

#include "anylist/console/console.hpp"

int main(int argc, char **argv) {
    anylist::console::ConsoleApp app{std::cout};
    app.initCfg();
    if (argc < 2) {
        app.replMode(std::cin);
        return 0;
    }
    for (int i = 1; i < argc; ++i) {
        if (auto ans = app.loadScript(argv[i]); !ans) {
            std::cerr << ans.error() << std::endl;
            return 1;
        }
    }
    return 0;
}
