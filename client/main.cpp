// ============================================================
// client/main.cpp -- LanShare client entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/discovery.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "download_client.hpp"
#include <iostream>
#include <string>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <csignal>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

static volatile std::sig_atomic_t g_stop = 0;

static void sig_handler(int /*sig*/) {
    g_stop = 1;
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <host> <port> list [options]\n"
        << "       " << prog << " <host> <port> get <id|all> [options]\n"
        << "       " << prog << " --discover [--wait SECONDS]\n"
        << "\n"
        << "  host            LanShare server address\n"
        << "  port            LanShare server port\n"
        << "  list            print the shared files\n"
        << "  get ID          download one file by id; 'all' downloads every file\n"
        << "\nOptions:\n"
        << "  --password PW   log in with the server password\n"
        << "  --token T       use an access token instead of a password\n"
        << "  --out DIR       destination directory (default: .)\n"
        << "  --wait N        seconds to listen for announcements (default: 3)\n"
        << "  --log-file PATH also write log lines to PATH\n"
        << "  --transfer-log PATH where failed downloads are recorded; '' disables\n"
        << "  --verbose       enable debug logging\n"
        << "  --quiet         keep log lines off the terminal (progress is still shown)\n"
        << "\nAn interrupted download resumes where it stopped when the same\n"
        << "command is run again.\n"
        << "\nExamples:\n"
        << "  " << prog << " 192.168.1.20 8080 list --password p@ss1\n"
        << "  " << prog << " 192.168.1.20 8080 get 0 --out ~/Downloads\n";
}

static int run_discover(int wait_secs) {
    DiscoveryService discovery;
    discovery.discover([](const PeerRecord& peer) {
        std::cout << peer.name << "  " << peer.host << " " << peer.port << "\n" << std::flush;
    });
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(wait_secs);
    while (!g_stop && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    discovery.stop();
    return 0;
}

static void print_progress(const std::string& name, u64 done, u64 total, double mbps) {
    double pct = total > 0 ? 100.0 * (double)done / (double)total : 100.0;
    char line[160];
    std::snprintf(line, sizeof(line), "\r%-32.32s %6.1f%%  %s / %s  %s   ",
                  name.c_str(), pct, utils::format_bytes(done).c_str(),
                  utils::format_bytes(total).c_str(), utils::format_mbps(mbps).c_str());
    std::cout << line << std::flush;
}

// Downloads one file; returns true when it completed
static bool download_one(ResumableDownloadClient& client, const RemoteFile& file,
                         const std::string& out_dir)
{
    DownloadTask task;
    task.file_id    = file.id;
    task.dest_dir   = out_dir;
    task.total_size = file.size;
    task.filename   = file.name;

    DownloadCallbacks cb;
    cb.on_progress = [&](u64 done, double mbps) {
        print_progress(file.name, done, file.size, mbps);
    };
    cb.on_complete = [&](const std::string& path) {
        print_progress(file.name, file.size, file.size, 0.0);
        std::cout << "\nSaved " << path << "\n";
    };
    cb.on_error = [&](ErrorKind kind, const std::string& message) {
        std::cout << "\n";
        std::cerr << "ERROR: " << file.name << ": " << error_kind_str(kind) << ": "
                  << message << "\n";
    };

    // Ctrl+C pauses; the partial file stays for the next run
    std::atomic<bool> done{false};
    std::thread watcher([&] {
        while (!done.load()) {
            if (g_stop) {
                client.pause();
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
    DownloadOutcome outcome = client.download(task, cb);
    done.store(true);
    watcher.join();
    return outcome == DownloadOutcome::COMPLETED;
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;
    Logger::get().set_component("client");

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::vector<std::string> positional;
    std::string password;
    std::string token;
    std::string out_dir = ".";
    std::string log_file;
    bool discover = false;
    int wait_secs = 3;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--password") == 0 && i + 1 < argc) {
            password = argv[++i];
        } else if (std::strcmp(argv[i], "--token") == 0 && i + 1 < argc) {
            token = argv[++i];
        } else if (std::strcmp(argv[i], "--out") == 0 && i + 1 < argc) {
            out_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--wait") == 0 && i + 1 < argc) {
            wait_secs = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--discover") == 0) {
            discover = true;
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--transfer-log") == 0 && i + 1 < argc) {
            Logger::get().set_transfer_log(argv[++i]);
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else if (std::strcmp(argv[i], "--quiet") == 0) {
            Logger::get().set_console(false);
        } else if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            positional.push_back(argv[i]);
        }
    }

    if (!log_file.empty() && !Logger::get().set_log_file(log_file)) {
        std::cerr << "ERROR: Cannot open log file: " << log_file << "\n";
        return 1;
    }

    std::signal(SIGINT,  sig_handler);
    std::signal(SIGTERM, sig_handler);

    if (discover) {
        if (wait_secs < 1 || wait_secs > 3600) {
            std::cerr << "ERROR: --wait must be 1-3600\n";
            return 1;
        }
        try {
            return run_discover(wait_secs);
        } catch (const std::exception& e) {
            std::cerr << "FATAL: " << e.what() << "\n";
            return 2;
        }
    }

    if (positional.size() < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string host    = positional[0];
    int port_int        = std::atoi(positional[1].c_str());
    std::string command = positional[2];

    if (!utils::validate_ip(host)) {
        std::cerr << "ERROR: Invalid IP address: " << host << "\n";
        return 1;
    }
    if (!utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << port_int << "\n";
        return 1;
    }
    if (!utils::validate_path(out_dir)) {
        std::cerr << "ERROR: Invalid --out directory\n";
        return 1;
    }
    if (command != "list" && !(command == "get" && positional.size() == 4)) {
        print_usage(argv[0]);
        return 1;
    }

    ClientConfig cfg;
    cfg.host  = host;
    cfg.port  = (u16)port_int;
    cfg.token = token;

    try {
        ResumableDownloadClient client(cfg);
        if (!password.empty()) client.login(password);

        std::vector<RemoteFile> files = client.fetch_file_list();

        if (command == "list") {
            for (const auto& f : files) {
                std::cout << f.id << "\t" << utils::format_bytes(f.size) << "\t" << f.name << "\n";
            }
            return 0;
        }

        std::vector<RemoteFile> wanted;
        if (positional[3] == "all") {
            wanted = files;
        } else {
            u64 id = 0;
            if (!utils::parse_u64(positional[3], id)) {
                std::cerr << "ERROR: Invalid file id: " << positional[3] << "\n";
                return 1;
            }
            for (const auto& f : files) {
                if (f.id == id) wanted.push_back(f);
            }
            if (wanted.empty()) {
                std::cerr << "ERROR: No file with id " << id << "\n";
                return 1;
            }
        }

        int failed = 0;
        for (const auto& f : wanted) {
            if (g_stop) break;
            if (!download_one(client, f, out_dir)) ++failed;
        }
        if (g_stop) {
            std::cerr << "Interrupted; run the same command again to resume.\n";
            return 1;
        }
        return failed == 0 ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
