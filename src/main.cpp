#include <cstdlib>
#include <iostream>
#include "app/orchestrator_app.h"

int main(int argc, char** argv)
{
    try {
        pipehub::OrchestratorApp app;
        return app.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
}
