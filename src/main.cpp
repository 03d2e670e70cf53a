#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

#include "core/Config.hpp"
#include "core/ProbabilityPipeline.hpp"
#include "io/FeatureReader.hpp"
#include "io/ScoreWriter.hpp"
#include "utils/ArgParser.hpp"
#include "utils/Logger.hpp"
#include "utils/ResourceMonitor.hpp"

int main(int argc, char** argv) {
    LoOP::Utils::ResourceMonitor monitor;

    LoOP::Config config;

    if (!LoOP::Utils::ArgParser::parse(argc, argv, config)) {
        return 1;  // Parse failed or help printed
    }

    auto& logger = LoOP::Utils::Logger::instance();
    logger.set_log_level(config.log_level);
    logger.set_color_enabled(config.use_color);
    if (!config.log_file.empty()) {
        logger.set_log_file(config.log_file);
    }

    if (!config.validate()) {
        LOG_ERROR("Configuration validation failed.");
        return 1;
    }

    config.print();

    try {
        LoOP::Utils::ScopedLogger main_scope("Main Execution");

        LOG_INFO("[1] Reading observations from " + config.input_path + "...");
        LoOP::ReaderOptions reader_options;
        reader_options.delimiter = config.delimiter;
        reader_options.has_header = config.has_header;
        reader_options.label_column = config.label_column;

        LoOP::FeatureReader reader(reader_options);
        LoOP::FeatureTable features = reader.read(config.input_path);

        std::stringstream ss;
        ss << "Loaded " << features.num_observations() << " observations x " << features.num_features()
           << " features";
        if (features.has_labels()) {
            ss << ", " << features.cluster_index.size() << " clusters from column '" << features.label_name << "'";
        }
        int missing = features.count_missing();
        if (missing > 0) {
            ss << ", " << missing << " missing values";
        }
        LOG_INFO(ss.str());

        LOG_INFO("[2] Computing local outlier probabilities...");
        LoOP::LocalOutlierProbability loop(config.to_loop_config());
        LoOP::StatisticsTable table = loop.fit_statistics(features.values, features.labels);

        LOG_INFO("[3] Writing results...");
        LoOP::ScoreWriter writer(config.output_dir, config.precision);
        LOG_INFO("Scores: " + writer.write_scores(table, features.cluster_index));
        if (config.write_statistics) {
            LOG_INFO("Statistics: " + writer.write_statistics(table, features.cluster_index));
            LOG_INFO("Clusters: " + writer.write_cluster_summary(table, features.cluster_index));
        }

        int nan_scores = static_cast<int>(table.loop_score.array().isNaN().count());
        double max_score = 0.0;
        for (int i = 0; i < table.size(); ++i) {
            if (!std::isnan(table.loop_score(i))) {
                max_score = std::max(max_score, table.loop_score(i));
            }
        }

        std::stringstream summary;
        summary << "Scored " << table.size() << " observations in " << table.num_clusters()
                << " clusters; max score " << max_score;
        if (nan_scores > 0) {
            summary << "; " << nan_scores << " scores undefined (NA)";
        }
        LOG_INFO(summary.str());

    } catch (const LoOP::ConfigurationError& e) {
        LOG_ERROR("Configuration error: " + std::string(e.what()));
        return 1;
    } catch (const LoOP::DegenerateClusterError& e) {
        LOG_ERROR("Degenerate input: " + std::string(e.what()));
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()));
        return 1;
    }

    monitor.print_stats("Total Execution");

    return 0;
}
