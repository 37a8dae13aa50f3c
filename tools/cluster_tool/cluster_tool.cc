#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "database/cluster_dao.h"
#include "database/database_manager.h"
#include "database/face_observation_dao.h"

namespace {

void print_usage() {
    std::cout << "Usage:" << std::endl;
    std::cout << "  cluster_tool init <db_path>" << std::endl;
    std::cout << "  cluster_tool import <db_path> <collection_id> <csv_file>" << std::endl;
    std::cout << "      csv row: source_image,crop_path,x,y,w,h,confidence,v0;v1;..." << std::endl;
    std::cout << "  cluster_tool clusters <db_path> <collection_id>" << std::endl;
    std::cout << "  cluster_tool members <db_path> <collection_id> <cluster_key>" << std::endl;
    std::cout << "  cluster_tool runs <db_path> <collection_id>" << std::endl;
    std::cout << "  cluster_tool stats <db_path>" << std::endl;
}

bool parse_collection(const std::string& text, int64_t& out) {
    try {
        size_t used = 0;
        out = std::stoll(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        std::cerr << "Invalid collection id: " << text << std::endl;
    }
    return false;
}

std::vector<std::string> split(const std::string& line, char sep) {
    std::vector<std::string> parts;
    std::stringstream ss(line);
    std::string item;
    while (std::getline(ss, item, sep)) {
        parts.push_back(item);
    }
    return parts;
}

// 解析一行 CSV，格式错误返回 false
bool parse_row(const std::string& line, int64_t collection_id, db::FaceObservation& out) {
    std::vector<std::string> fields = split(line, ',');
    if (fields.size() != 8) return false;

    try {
        out.collection_id = collection_id;
        out.source_image_path = fields[0];
        out.crop_path = fields[1];
        out.bbox.x = std::stof(fields[2]);
        out.bbox.y = std::stof(fields[3]);
        out.bbox.width = std::stof(fields[4]);
        out.bbox.height = std::stof(fields[5]);
        out.confidence = std::stof(fields[6]);
        out.embedding.clear();
        for (const std::string& v : split(fields[7], ';')) {
            if (!v.empty()) out.embedding.push_back(std::stof(v));
        }
    } catch (const std::exception&) {
        return false;
    }
    return !out.embedding.empty();
}

int import_csv(int64_t collection_id, const std::string& csv_path) {
    std::ifstream file(csv_path);
    if (!file.is_open()) {
        std::cerr << "Could not open csv file: " << csv_path << std::endl;
        return 1;
    }

    db::DatabaseManager& manager = db::DatabaseManager::instance();
    db::FaceObservationDao dao;

    if (!manager.begin_transaction()) {
        std::cerr << "Failed to begin transaction: " << manager.last_error() << std::endl;
        return 1;
    }

    int imported = 0;
    int rejected = 0;
    int line_no = 0;
    std::string line;
    while (std::getline(file, line)) {
        line_no++;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        if (line_no == 1 && line.compare(0, 12, "source_image") == 0) continue;  // 表头

        db::FaceObservation obs;
        if (!parse_row(line, collection_id, obs)) {
            std::cerr << "Line " << line_no << ": malformed row, skipped" << std::endl;
            rejected++;
            continue;
        }
        if (dao.add_observation(obs) == -1) {
            std::cerr << "Line " << line_no << ": insert failed, aborting import" << std::endl;
            manager.rollback_transaction();
            return 1;
        }
        imported++;
    }

    if (!manager.commit_transaction()) {
        std::cerr << "Commit failed: " << manager.last_error() << std::endl;
        manager.rollback_transaction();
        return 1;
    }

    std::cout << "Imported " << imported << " observations into collection " << collection_id;
    if (rejected > 0) std::cout << " (" << rejected << " rows rejected)";
    std::cout << std::endl;
    return 0;
}

void print_run(const db::ClusterRunRecord& run) {
    char time_buf[32] = {0};
    std::tm tm_buf;
    localtime_r(&run.finished_at, &tm_buf);
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", &tm_buf);

    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Run #" << run.run_id << " finished " << time_buf << std::endl;
    std::cout << "  eps=" << run.eps << " min_samples=" << run.min_samples
              << " (" << run.param_source << ")" << std::endl;
    std::cout << "  observations: " << run.observations_loaded << " loaded, "
              << run.observations_skipped << " skipped" << std::endl;
    std::cout << "  clusters: " << run.cluster_count << ", noise: " << run.noise_count
              << " (" << run.noise_ratio * 100.0f << "%)" << std::endl;
    std::cout << "  silhouette=" << run.silhouette << " davies_bouldin=" << run.davies_bouldin
              << " compactness=" << run.compactness << " separation=" << run.separation << std::endl;
    std::cout << "  quality: " << run.overall_quality << " (" << run.quality_label << ")" << std::endl;
    std::cout << "  representatives by level: " << run.level_counts[0] << " / " << run.level_counts[1]
              << " / " << run.level_counts[2] << " / " << run.level_counts[3] << std::endl;
    for (const auto& s : run.suggestions) {
        std::cout << "  - " << s << std::endl;
    }
    std::cout.unsetf(std::ios::floatfield);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];
    std::string db_path = argv[2];

    if (!db::DatabaseManager::instance().open(db_path)) {
        std::cerr << "Failed to open database: " << db_path << std::endl;
        return 1;
    }

    int64_t collection_id = -1;
    if (command != "init" && command != "stats") {
        if (argc < 4 || !parse_collection(argv[3], collection_id)) {
            print_usage();
            return 1;
        }
    }

    if (command == "init") {
        std::cout << "Database initialized successfully at " << db_path << std::endl;
    }
    else if (command == "import") {
        if (argc < 5) {
            std::cout << "Usage: cluster_tool import <db_path> <collection_id> <csv_file>" << std::endl;
            return 1;
        }
        return import_csv(collection_id, argv[4]);
    }
    else if (command == "clusters") {
        db::ClusterDao dao;
        auto clusters = dao.get_clusters(collection_id);
        std::cout << "Key\tFaces\tPhotos\tRep\tLevel\tRepQ\tSilh" << std::endl;
        std::cout << std::fixed << std::setprecision(2);
        for (const auto& c : clusters) {
            std::cout << c.cluster_key << "\t" << c.member_ids.size() << "\t" << c.photo_count << "\t"
                      << c.representative_id << "\t" << c.selection_level << "\t"
                      << c.representative_quality << "\t" << c.silhouette << std::endl;
        }
        std::cout << clusters.size() << " clusters" << std::endl;
    }
    else if (command == "members") {
        if (argc < 5) {
            std::cout << "Usage: cluster_tool members <db_path> <collection_id> <cluster_key>" << std::endl;
            return 1;
        }
        db::ClusterDao dao;
        auto cluster = dao.get_cluster(collection_id, argv[4]);
        if (!cluster) {
            std::cerr << "Cluster not found: " << argv[4] << std::endl;
            return 1;
        }
        for (int64_t id : cluster->member_ids) {
            std::cout << id << (id == cluster->representative_id ? "\t*" : "") << std::endl;
        }
    }
    else if (command == "runs") {
        db::ClusterDao dao;
        std::cout << "Total runs: " << dao.count_runs(collection_id) << std::endl;
        auto run = dao.get_latest_run(collection_id);
        if (run) {
            print_run(*run);
        }
    }
    else if (command == "stats") {
        db::FaceObservationDao odao;
        db::ClusterDao cdao;
        std::cout << "Collection\tFaces\tClusters\tRuns" << std::endl;
        for (int64_t id : odao.list_collections()) {
            std::cout << id << "\t" << odao.count_observations(id) << "\t"
                      << cdao.get_clusters(id).size() << "\t" << cdao.count_runs(id) << std::endl;
        }
    }
    else {
        print_usage();
        return 1;
    }

    return 0;
}
