#include <iostream>
#include <exception>

#include "voxgrid_app.hpp"

int main(int argc, char* argv[]) {
    try {
        voxgrid::VoxGridApp app(argc, argv);
        app.run();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
