// ============================================================
// server/main.cpp -- LanShare server entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/discovery.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "transfer_server.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>
#include <chrono>
#include <thread>
#include <memory>
#include <vector>

static volatile std::sig_atomic_t g_stop = 0;

static void sig_handler(int /*sig*/) {
    g_stop = 1;
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <path>... [options]\n"
        << "\n"
        << "  path             file or directory to share; directories are shared\n"
        << "                   file by file. '-' shares standard input (needs --stdin-size)\n"
        << "\nOptions:\n"
        << "  --password PW    require a password before listing or downloading\n"
        << "  --port N         TCP port (default: 0 = pick a free port)\n"
        << "  --listen IP      address to bind (default: 0.0.0.0)\n"
        << "  --host IP        address to advertise in the URL (default: first LAN IPv4)\n"
        << "  --bundle-name N  file name of the Download All archive\n"
        << "  --temp-dir DIR   where bundle archives are built (default: system temp)\n"
        << "  --max-archive-mb N  refuse bundles larger than N MiB (default: unlimited)\n"
        << "  --stdin-size N   byte count standard input will deliver\n"
        << "  --stdin-name N   name for the standard input entry (default: stdin.bin)\n"
        << "  --broadcast NAME announce this server on the LAN under NAME\n"
        << "  --log-file PATH  also write log lines to PATH\n"
        << "  --transfer-log PATH  where failed transfers are recorded; '' disables\n"
        << "  --verbose        enable debug logging\n"
        << "\nExample:\n"
        << "  " << prog << " ~/Videos/trip.mp4 ~/Photos --password p@ss1\n";
}

static bool add_path(const std::string& path, SharedFileList& files) {
    if (file_io::is_directory(path)) {
        for (const auto& f : file_io::scan_directory(path)) {
            files.push_back(SharedFile::from_path(f.abs_path, f.rel_path));
        }
        return true;
    }
    if (!file_io::file_exists(path)) {
        std::cerr << "ERROR: No such file: " << path << "\n";
        return false;
    }
    files.push_back(SharedFile::from_path(path));
    return true;
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;
    Logger::get().set_component("server");

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    ServerConfig cfg;
    std::vector<std::string> paths;
    std::string stdin_name = "stdin.bin";
    std::string stdin_size_arg;
    std::string broadcast_name;
    std::string log_file;
    int port_int = 0;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--password") == 0 && i + 1 < argc) {
            cfg.password = argv[++i];
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            port_int = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            cfg.listen_ip = argv[++i];
        } else if (std::strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
            cfg.advertise_host = argv[++i];
        } else if (std::strcmp(argv[i], "--bundle-name") == 0 && i + 1 < argc) {
            cfg.bundle_name = argv[++i];
        } else if (std::strcmp(argv[i], "--temp-dir") == 0 && i + 1 < argc) {
            cfg.temp_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--max-archive-mb") == 0 && i + 1 < argc) {
            u64 mb = 0;
            if (!utils::parse_u64(argv[++i], mb) || mb == 0) {
                std::cerr << "ERROR: --max-archive-mb must be a positive number\n";
                return 1;
            }
            cfg.max_archive_bytes = mb * 1024 * 1024;
        } else if (std::strcmp(argv[i], "--stdin-size") == 0 && i + 1 < argc) {
            stdin_size_arg = argv[++i];
        } else if (std::strcmp(argv[i], "--stdin-name") == 0 && i + 1 < argc) {
            stdin_name = argv[++i];
        } else if (std::strcmp(argv[i], "--broadcast") == 0 && i + 1 < argc) {
            broadcast_name = argv[++i];
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--transfer-log") == 0 && i + 1 < argc) {
            Logger::get().set_transfer_log(argv[++i]);
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            paths.push_back(argv[i]);
        }
    }

    if (paths.empty()) {
        std::cerr << "ERROR: Nothing to share\n";
        return 1;
    }
    if (!utils::validate_ip(cfg.listen_ip)) {
        std::cerr << "ERROR: Invalid listen address: " << cfg.listen_ip << "\n";
        return 1;
    }
    if (!cfg.advertise_host.empty() && !utils::validate_ip(cfg.advertise_host)) {
        std::cerr << "ERROR: Invalid host address: " << cfg.advertise_host << "\n";
        return 1;
    }
    if (!utils::validate_port(port_int, true)) {
        std::cerr << "ERROR: Invalid port: " << port_int << "\n";
        return 1;
    }
    if (cfg.bundle_name.empty()) {
        std::cerr << "ERROR: --bundle-name must not be empty\n";
        return 1;
    }
    if (!log_file.empty() && !Logger::get().set_log_file(log_file)) {
        std::cerr << "ERROR: Cannot open log file: " << log_file << "\n";
        return 1;
    }
    cfg.listen_port = (u16)port_int;

    ServerCallbacks callbacks;
    callbacks.on_client_connected = [](const std::string& ip) {
        LOG_INFO("Client connected: " + ip);
    };
    callbacks.on_progress = [](u64 sent, double mbps) {
        LOG_DEBUG("Sent " + utils::format_bytes(sent) + " at " + utils::format_mbps(mbps));
    };
    callbacks.on_download_complete = [](int index, bool via_browser) {
        std::string what = index == BUNDLE_FILE_INDEX ? std::string("bundle")
                                                      : "file #" + std::to_string(index);
        LOG_INFO("Download of " + what + " finished (" +
                 (via_browser ? "browser" : "app") + ")");
    };
    callbacks.on_error = [](const std::string& message) {
        LOG_WARN("Transfer failed: " + message);
    };

    try {
        SharedFileList files;
        bool stdin_used = false;
        for (const auto& p : paths) {
            if (p == "-") {
                u64 size = 0;
                if (stdin_used || !utils::parse_u64(stdin_size_arg, size)) {
                    std::cerr << "ERROR: '-' needs --stdin-size and may appear once\n";
                    return 1;
                }
                stdin_used = true;
                files.push_back(SharedFile::from_stream(
                    stdin_name, size,
                    std::make_unique<file_io::FdStream>(STDIN_FILENO, false)));
            } else if (!add_path(p, files)) {
                return 1;
            }
        }
        if (files.empty()) {
            std::cerr << "ERROR: No regular files found\n";
            return 1;
        }

        TransferServer server(std::move(cfg), std::move(callbacks));
        ServerInfo info = server.start(std::move(files));

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        std::cout << "Open " << info.url() << " on the receiving device\n";
        std::string token = server.token();
        if (!token.empty()) {
            std::cout << "Direct link: " << info.url() << "?token=" << token << "\n";
        }
        std::cout << "Press Ctrl+C to stop sharing.\n" << std::flush;

        DiscoveryService discovery;
        if (!broadcast_name.empty()) discovery.broadcast(broadcast_name, info.port);

        while (!g_stop) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        LOG_INFO("Shutting down");
        discovery.stop();
        server.stop();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
