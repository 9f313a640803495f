#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>
#include "../../../shared/cpp/swerve_proto/include/util.hpp"
#include "../../../shared/cpp/upload_sdk/include/http_transports.hpp"
#include "../../../shared/cpp/upload_sdk/include/uploader.hpp"

using json = nlohmann::json;

static CancellationToken g_cancel;

static void usage() {
    std::cerr << "swerve-send usage:\n"
              << "  swerve-send --file <path> [--url <origin>] [--title <text>] [--endpoint <url>]\n"
              << "              [--token <bearer>] [--chunk-size N] [--timeout-ms N] [--job-id <id>]\n"
              << "              [--disable direct,beacon,form] [--plain]\n";
}

static std::string read_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open " + p.string());
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

static std::vector<Tier> parse_tiers(const std::string& list) {
    std::vector<Tier> out;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) continue;
        auto t = tier_from_name(item);
        if (!t) throw std::runtime_error("unknown tier '" + item + "'");
        out.push_back(*t);
    }
    return out;
}

int main(int argc, char** argv) {
    HttpTransportConfig http;
    http.endpoint = getenv_or("SWERVE_ENDPOINT", http.endpoint);
    http.auth_token = getenv_or("SWERVE_AUTH_TOKEN", "");
    http.timeout_ms = getenv_long_or("SWERVE_TIMEOUT_MS", http.timeout_ms);
    UploadOptions opts;
    opts.max_chunk_size = (std::size_t)getenv_long_or("SWERVE_CHUNK_SIZE", (long)opts.max_chunk_size);

    std::string file, origin, title;
    try {
        http.disabled = parse_tiers(getenv_or("SWERVE_DISABLED_TIERS", ""));
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--file" && i + 1 < argc) file = argv[++i];
            else if (a == "--url" && i + 1 < argc) origin = argv[++i];
            else if (a == "--title" && i + 1 < argc) title = argv[++i];
            else if (a == "--endpoint" && i + 1 < argc) http.endpoint = argv[++i];
            else if (a == "--token" && i + 1 < argc) http.auth_token = argv[++i];
            else if (a == "--chunk-size" && i + 1 < argc) opts.max_chunk_size = std::stoul(argv[++i]);
            else if (a == "--timeout-ms" && i + 1 < argc) http.timeout_ms = std::stol(argv[++i]);
            else if (a == "--job-id" && i + 1 < argc) opts.job_id = argv[++i];
            else if (a == "--disable" && i + 1 < argc) http.disabled = parse_tiers(argv[++i]);
            else if (a == "--plain") opts.encoding = "plain";
            else { usage(); return 2; }
        }
    } catch (const std::exception& e) {
        std::cerr << "[swerve-send] " << e.what() << "\n";
        usage();
        return 2;
    }
    if (file.empty() || opts.max_chunk_size == 0) { usage(); return 2; }

    try {
        std::string payload = read_file(file);
        json meta = {
            {"url", origin.empty() ? "file://" + std::filesystem::absolute(file).string() : origin},
            {"title", title.empty() ? std::filesystem::path(file).filename().string() : title},
            {"referrer", nullptr},
            {"userAgent", "swerve-send/0.2.0"},
            {"capturedAt", iso8601_now()},
            {"byteSize", payload.size()}
        };

        TransportSelector selector(make_http_transports(http));
        Upload upload(selector, std::move(payload), meta, opts, g_cancel);
        std::signal(SIGINT, [](int) { g_cancel.cancel(); });

        std::cout << "[swerve-send] job " << upload.job_id() << ": " << upload.report().total_chunks
                  << " chunk(s) to " << http.endpoint << std::endl;
        while (auto p = upload.next()) {
            int pct = p->total ? (int)(100 * p->completed / p->total) : 100;
            std::cout << "[swerve-send] " << p->completed << "/" << p->total << " chunks (" << pct << "%)" << std::endl;
        }

        const UploadReport& r = upload.report();
        if (r.state == UploadState::Finalized) {
            std::cout << "[OK] Sent " << r.chunks_sent << " chunk(s), " << r.chunks_confirmed
                      << " confirmed by server, via";
            for (Tier t : r.tiers_used) std::cout << " " << tier_name(t);
            std::cout << "\n";
            if (r.finalization_confirmed) std::cout << "[OK] Server holds all " << r.total_chunks << " chunk(s)\n";
            return 0;
        }
        if (r.state == UploadState::Cancelled) {
            std::cerr << "[swerve-send] cancelled after " << r.chunks_sent << "/" << r.total_chunks << " chunks\n";
            return 130;
        }
        std::cerr << "[ERROR] " << (r.failure ? send_status_name(r.failure->status) : "upload failed");
        if (r.failure && r.failure->status == SendStatus::AllTransportsBlocked) {
            std::cerr << ": every transport was refused by this environment; allow one of direct/beacon/form";
        }
        std::cerr << "\n";
        if (r.failure) std::cerr << describe_attempts(r.failure->attempts);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
