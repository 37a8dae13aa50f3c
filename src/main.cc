#include <fstream>
#include <iomanip>
#include <iostream>  // 引入 cout 所在的头文件
#include <stdexcept>
#include <string>
#include <vector>
#include "config.h"
// app
#include "app/cluster_engine.h"
#include "app/cluster_worker.h"
#include "app/run_monitor.h"
// service
#include "service/engine_settings.h"
// database
#include "database/database_manager.h"

namespace {

void print_usage() {
    std::cout << "Usage:" << std::endl;
    std::cout << "  face_cluster <db_path> <collection_id>... [--config <file>]" << std::endl;
}

void print_result(const RunResult& r) {
    std::cout << "----------------------------------------" << std::endl;
    std::cout << "Collection " << r.collection_id << ": " << run_state_name(r.state);
    if (r.error != ErrorCode::None) {
        std::cout << " [" << error_code_name(r.error) << "] " << r.diagnostic;
    }
    std::cout << std::endl;
    if (r.state != RunState::Done) return;

    const ClusterQualityMetrics& q = r.quality;
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "  Params: eps=" << r.params.eps << " min_samples=" << r.params.min_samples
              << " (" << r.params.source << ")" << std::endl;
    std::cout << "  Observations: " << r.stats.observations_loaded << " loaded, "
              << r.stats.observations_skipped << " skipped" << std::endl;
    std::cout << "  Clusters: " << q.cluster_count << ", noise: " << q.noise_count
              << " (" << q.noise_ratio * 100.0f << "%)" << std::endl;
    std::cout << "  Silhouette: " << q.silhouette_score
              << "  Davies-Bouldin: " << q.davies_bouldin_index
              << "  Compactness: " << q.avg_cluster_compactness
              << "  Separation: " << q.avg_cluster_separation << std::endl;
    std::cout << "  Overall quality: " << q.overall_quality
              << " (" << cluster_quality_label_name(q.quality_label) << ")" << std::endl;
    std::cout << "  Representatives by level: "
              << r.stats.level_counts[0] << " / " << r.stats.level_counts[1] << " / "
              << r.stats.level_counts[2] << " / " << r.stats.level_counts[3] << std::endl;
    std::cout << "  Suggestions:" << std::endl;
    for (const auto& s : q.tuning_suggestions) {
        std::cout << "    - " << s << std::endl;
    }
    std::cout.unsetf(std::ios::floatfield);
    std::cout << std::setprecision(6);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage();
        return 1;
    }

    std::string db_path = argv[1];
    std::string config_path;
    std::vector<int64_t> collections;

    // 命令行参数解析
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                print_usage();
                return 1;
            }
            config_path = argv[++i];
            continue;
        }
        try {
            size_t used = 0;
            int64_t id = std::stoll(arg, &used);
            if (used != arg.size()) throw std::invalid_argument(arg);
            collections.push_back(id);
        } catch (const std::exception&) {
            std::cerr << "Invalid collection id: " << arg << std::endl;
            return 1;
        }
    }
    if (collections.empty()) {
        print_usage();
        return 1;
    }

    // 加载运行参数 (未指定时尝试默认路径)
    service::EngineSettings settings;
    service::SettingsLoader loader;
    if (!config_path.empty()) {
        if (!loader.load_file(config_path, settings)) {
            return 1;
        }
    } else if (std::ifstream(Config::Path::SETTINGS).good()) {
        loader.load_file(Config::Path::SETTINGS, settings);
    }

    std::string error;
    if (!settings.validate(error)) {
        std::cerr << "Invalid settings: " << error << std::endl;
        return 1;
    }

    std::cout << "========================================" << std::endl;
    std::cout << "Configuration:" << std::endl;
    std::cout << "  Database: " << db_path << std::endl;
    std::cout << "  eps: " << settings.clustering.eps << std::endl;
    std::cout << "  min_samples: " << settings.clustering.min_samples << std::endl;
    std::cout << "  Metric: " << distance_metric_name(settings.clustering.metric) << std::endl;
    std::cout << "  Adaptive params: " << (settings.clustering.adaptive ? "on" : "off") << std::endl;
    std::cout << "  Quality threshold: " << settings.selection.quality_threshold << std::endl;
    std::cout << "========================================" << std::endl;

    if (!db::DatabaseManager::instance().open(db_path)) {
        std::cerr << "Failed to open database: " << db_path << std::endl;
        return 1;
    }

    ClusterEngine engine(settings);
    RunMonitor monitor;
    monitor.set_state_callback([](int64_t collection_id, RunState state) {
        std::cout << "[face_cluster] Collection " << collection_id << " -> " << run_state_name(state) << std::endl;
    });
    monitor.set_progress_callback([](int64_t collection_id, int done, int total) {
        std::cout << "[face_cluster] Collection " << collection_id << ": cluster " << done << "/" << total << std::endl;
    });

    ClusterWorker worker(&engine, &monitor);
    worker.start();
    for (int64_t id : collections) {
        worker.push_task(id);
    }
    worker.wait_idle();
    worker.stop();

    bool all_done = true;
    for (int64_t id : collections) {
        std::optional<RunResult> r = worker.latest_result(id);
        if (!r) {
            std::cerr << "Collection " << id << ": no result" << std::endl;
            all_done = false;
            continue;
        }
        print_result(*r);
        if (r->state != RunState::Done) all_done = false;
    }

    db::DatabaseManager::instance().close();
    return all_done ? 0 : 2;
}
