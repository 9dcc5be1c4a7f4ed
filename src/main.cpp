#include "AutomationPipeline.h"
#include "CuratorExceptions.h"
#include "PipelineConfig.h"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            std::cout << PipelineConfig::usage() << "\n";
            return 0;
        }
    }

    try {
        const PipelineConfig config = PipelineConfig::fromArgs(argc, argv);
        AutomationPipeline pipeline;
        return pipeline.run(config);
    } catch (const Curator::CuratorException& e) {
        std::cerr << "[Curator Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Curator Error] " << e.what() << "\n";
        return 1;
    }
}
