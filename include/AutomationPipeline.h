#pragma once

#include "DataPipeline.h"
#include "PipelineConfig.h"

#include <string>

class AutomationPipeline final {
public:
    /**
     * @brief Loads the dataset, runs the configured stages and writes the requested outputs.
     * @return 0 when the run completed, whether or not validation passed.
     * @throws Curator::CuratorException subclasses on I/O, dataset or configuration faults.
     */
    int run(const PipelineConfig& config);

    /**
     * @brief Maps a CLI config onto stage options; resolves the validator preset.
     */
    static PipelineOptions buildOptions(const PipelineConfig& config);
};
