#include "application.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    autosplit::Application app;

    if (!app.initialize(argc, argv)) {
        std::cerr << "Failed to initialize autosplit runner" << std::endl;
        return 1;
    }

    app.run();
    app.shutdown();
    return 0;
}
