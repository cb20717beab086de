#include "archup/core/config.hpp"
#include "archup/events/components.hpp"
#include "archup/events/event_bus.hpp"
#include "archup/store/directory_store.hpp"
#include "archup/upload/descriptor.hpp"
#include "archup/upload/local_source.hpp"
#include "archup/upload/uploader.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

constexpr const char* kDefaultStoreDir = ".archup-store";

struct UploadArgs {
    std::string vault_name;
    fs::path file;
    std::optional<std::string> description;
    std::optional<std::uint64_t> part_size_mb;
    std::optional<std::size_t> concurrency;
    std::optional<std::string> session_id;
    std::optional<fs::path> resume_from;
    std::optional<fs::path> config_path;
    std::optional<std::string> log_level;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [--store DIR] [--log-level LEVEL] <command> [ARGS]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  upload <vault> <file> [OPTIONS]   Upload a file as one archive\n";
    std::cout << "  create-vault <vault>              Create a vault in the store\n";
    std::cout << "  list-uploads <vault>              List unfinished multipart uploads\n";
    std::cout << "  list-parts <vault> <upload_id>    List parts already received for an upload\n";
    std::cout << "  abort <vault> <upload_id>         Abort an unfinished upload\n";
    std::cout << "  inventory <vault>                 Print the vault's archive list as JSON\n";
    std::cout << "  get-archive <vault> <id> <file>   Copy an archive to a new local file\n";
    std::cout << "  delete-archive <vault> <id>       Delete an archive\n";
    std::cout << "\n";
    std::cout << "Upload options:\n";
    std::cout << "  -d DESCRIPTION        Archive description\n";
    std::cout << "  -p MB                 Part size in MiB, power of two in [1, 4096] (default: 8)\n";
    std::cout << "  -t N                  Parts uploaded in parallel (default: CPUs x 5)\n";
    std::cout << "  -u UPLOAD_ID          Resume the given multipart upload\n";
    std::cout << "  --resume-from FILE    Resume from a saved session file\n";
    std::cout << "  --config FILE         JSON file with upload settings\n";
    std::cout << "\n";
    std::cout << "Global options:\n";
    std::cout << "  --store DIR           Local vault directory (default: " << kDefaultStoreDir << ")\n";
    std::cout << "  --log-level LEVEL     trace, debug, info, warn, error, critical, off\n";
    std::cout << "  --help                Show this help message\n";
}

template<typename T>
bool parse_number(const std::string& text, T& out) {
    try {
        std::size_t consumed = 0;
        const auto value = std::stoull(text, &consumed);
        if (consumed != text.size()) {
            return false;
        }
        out = static_cast<T>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

int run_upload(archup::store::DirectoryStore& store, const UploadArgs& args) {
    archup::UploadConfig config;
    if (args.config_path.has_value()) {
        auto loaded = archup::load_config(*args.config_path);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error().describe());
            return kExitUsage;
        }
        config = std::move(loaded.value());
    }

    std::optional<std::string> resume_id = args.session_id;
    config.vault_name = args.vault_name;
    if (args.description.has_value()) {
        config.description = *args.description;
    }
    if (args.part_size_mb.has_value()) {
        config.part_size_mb = *args.part_size_mb;
    }
    if (args.concurrency.has_value()) {
        config.concurrency = *args.concurrency;
    }
    if (args.log_level.has_value()) {
        config.log_level = *args.log_level;
    }

    if (args.resume_from.has_value()) {
        auto descriptor = archup::upload::load_descriptor(*args.resume_from);
        if (descriptor.is_error()) {
            spdlog::error("{}", descriptor.error().describe());
            return kExitUsage;
        }
        if (descriptor.value().vault_name != config.vault_name) {
            spdlog::error("Session file belongs to vault {}, not {}", descriptor.value().vault_name, config.vault_name);
            return kExitUsage;
        }
        resume_id = descriptor.value().session_id;
    }

    if (auto valid = config.validate(); valid.is_error()) {
        spdlog::error("{}", valid.error().describe());
        return kExitUsage;
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    spdlog::info("Reading file...");
    auto file = archup::upload::FileSource::open(args.file);
    if (file.is_error()) {
        spdlog::error("{}", file.error().describe());
        return kExitFailure;
    }
    archup::upload::SharedSource source(std::move(file.value()));

    archup::events::EventBus bus;
    archup::events::LoggerComponent logger(bus);
    archup::events::MetricsComponent metrics(bus);

    const auto descriptor_path = args.resume_from.value_or(archup::upload::descriptor_path_for(args.file));

    archup::upload::ArchiveUploader uploader(store, bus, config);
    uploader.set_session_listener([&descriptor_path](const archup::upload::SessionDescriptor& descriptor) {
        if (auto res = archup::upload::save_descriptor(descriptor_path, descriptor); res.is_error()) {
            spdlog::warn("Could not save session file: {}", res.error().message);
        }
    });

    auto outcome = uploader.upload(source, resume_id);
    metrics.print_stats();

    if (outcome.is_error()) {
        const auto& error = outcome.error();
        spdlog::error("Upload failed: {}", error.describe());
        if (error.resume.has_value()) {
            archup::upload::SessionDescriptor descriptor{error.resume->session_id, error.resume->vault_name,
                                                         error.resume->part_size, error.resume->total_size};
            if (auto res = archup::upload::save_descriptor(descriptor_path, descriptor); res.is_error()) {
                spdlog::warn("Could not save session file: {}", res.error().message);
            }
            std::cout << "Upload can be resumed with: -u " << error.resume->session_id << "\n";
            std::cout << "Session saved to: " << descriptor_path.string() << "\n";
        }
        return kExitFailure;
    }

    const auto& result = outcome.value();
    std::error_code ec;
    fs::remove(descriptor_path, ec);

    std::cout << "Calculated tree hash: " << archup::hash::to_hex(result.root_digest) << "\n";
    std::cout << "Remote tree hash:     " << result.receipt.checksum << "\n";
    std::cout << "Location:             " << result.receipt.location << "\n";
    std::cout << "Archive id:           " << result.receipt.archive_id << "\n";
    return kExitOk;
}

int run_create_vault(archup::store::DirectoryStore& store, const std::string& vault_name) {
    auto res = store.create_vault(vault_name);
    if (res.is_error()) {
        spdlog::error("{}", res.error().describe());
        return kExitFailure;
    }
    std::cout << "Vault " << vault_name << " ready\n";
    return kExitOk;
}

int run_list_uploads(archup::store::DirectoryStore& store, const std::string& vault_name) {
    auto sessions = store.list_sessions(vault_name);
    if (sessions.is_error()) {
        spdlog::error("{}", sessions.error().describe());
        return kExitFailure;
    }
    if (sessions.value().empty()) {
        std::cout << "No unfinished uploads in " << vault_name << "\n";
        return kExitOk;
    }
    for (const auto& session : sessions.value()) {
        std::cout << session.session_id << "  " << session.created_at << "  part_size=" << session.part_size
                  << "  " << session.description << "\n";
    }
    return kExitOk;
}

int run_list_parts(archup::store::DirectoryStore& store, const std::string& vault_name, const std::string& session_id) {
    std::optional<std::string> marker;
    std::size_t count = 0;
    do {
        auto page = store.list_session_parts(vault_name, session_id, marker);
        if (page.is_error()) {
            spdlog::error("{}", page.error().describe());
            return kExitFailure;
        }
        if (!marker.has_value()) {
            std::cout << "Part size: " << page.value().part_size << " bytes\n";
        }
        for (const auto& part : page.value().parts) {
            std::cout << "bytes " << part.start << "-" << part.end << "  " << part.checksum << "\n";
            ++count;
        }
        marker = page.value().next_marker;
    } while (marker.has_value());
    std::cout << count << " parts received\n";
    return kExitOk;
}

int run_abort(archup::store::DirectoryStore& store, const std::string& vault_name, const std::string& session_id) {
    auto res = store.abort_session(vault_name, session_id);
    if (res.is_error()) {
        spdlog::error("{}", res.error().describe());
        return kExitFailure;
    }
    std::cout << "Aborted upload " << session_id << "\n";
    return kExitOk;
}

int run_inventory(archup::store::DirectoryStore& store, const std::string& vault_name) {
    auto archives = store.list_archives(vault_name);
    if (archives.is_error()) {
        spdlog::error("{}", archives.error().describe());
        return kExitFailure;
    }
    std::cout << archup::store::inventory_json(vault_name, archives.value()) << "\n";
    return kExitOk;
}

int run_get_archive(archup::store::DirectoryStore& store,
                    const std::string& vault_name,
                    const std::string& archive_id,
                    const fs::path& destination) {
    spdlog::info("Retrieving archive {}...", archive_id);
    auto info = store.retrieve_archive(vault_name, archive_id, destination);
    if (info.is_error()) {
        spdlog::error("{}", info.error().describe());
        return kExitFailure;
    }
    std::cout << "Wrote " << info.value().size << " bytes to " << destination.string() << "\n";
    std::cout << "Tree hash: " << info.value().checksum << "\n";
    return kExitOk;
}

int run_delete_archive(archup::store::DirectoryStore& store,
                       const std::string& vault_name,
                       const std::string& archive_id) {
    auto res = store.delete_archive(vault_name, archive_id);
    if (res.is_error()) {
        spdlog::error("{}", res.error().describe());
        return kExitFailure;
    }
    std::cout << "Deleted archive " << archive_id << "\n";
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    fs::path store_dir = kDefaultStoreDir;
    UploadArgs upload_args;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next_value = [&](std::string& out) {
            if (i + 1 >= argc) {
                spdlog::error("{} requires a value", arg);
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return kExitOk;
        } else if (arg == "--store") {
            if (!next_value(value)) {
                return kExitUsage;
            }
            store_dir = value;
        } else if (arg == "--log-level") {
            if (!next_value(value)) {
                return kExitUsage;
            }
            if (spdlog::level::from_str(value) == spdlog::level::off && value != "off") {
                spdlog::error("Unknown log level: {}", value);
                return kExitUsage;
            }
            upload_args.log_level = value;
            spdlog::set_level(spdlog::level::from_str(value));
        } else if (arg == "-d") {
            if (!next_value(value)) {
                return kExitUsage;
            }
            upload_args.description = value;
        } else if (arg == "-p") {
            std::uint64_t part_size_mb = 0;
            if (!next_value(value) || !parse_number(value, part_size_mb)) {
                spdlog::error("Invalid part size: {}", value);
                return kExitUsage;
            }
            upload_args.part_size_mb = part_size_mb;
        } else if (arg == "-t") {
            std::size_t threads = 0;
            if (!next_value(value) || !parse_number(value, threads) || threads == 0) {
                spdlog::error("Invalid thread count: {}", value);
                return kExitUsage;
            }
            upload_args.concurrency = threads;
        } else if (arg == "-u") {
            if (!next_value(value)) {
                return kExitUsage;
            }
            upload_args.session_id = value;
        } else if (arg == "--resume-from") {
            if (!next_value(value)) {
                return kExitUsage;
            }
            upload_args.resume_from = fs::path(value);
        } else if (arg == "--config") {
            if (!next_value(value)) {
                return kExitUsage;
            }
            upload_args.config_path = fs::path(value);
        } else if (!arg.empty() && arg[0] == '-') {
            spdlog::error("Unknown option: {}", arg);
            print_usage(argv[0]);
            return kExitUsage;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        print_usage(argv[0]);
        return kExitUsage;
    }

    const std::string command = positional[0];
    archup::store::DirectoryStore store(store_dir);

    if (command == "upload" && positional.size() == 3) {
        if (upload_args.session_id.has_value() && upload_args.resume_from.has_value()) {
            spdlog::error("-u and --resume-from cannot be combined");
            return kExitUsage;
        }
        upload_args.vault_name = positional[1];
        upload_args.file = positional[2];
        return run_upload(store, upload_args);
    }
    if (command == "create-vault" && positional.size() == 2) {
        return run_create_vault(store, positional[1]);
    }
    if (command == "list-uploads" && positional.size() == 2) {
        return run_list_uploads(store, positional[1]);
    }
    if (command == "list-parts" && positional.size() == 3) {
        return run_list_parts(store, positional[1], positional[2]);
    }
    if (command == "abort" && positional.size() == 3) {
        return run_abort(store, positional[1], positional[2]);
    }
    if (command == "inventory" && positional.size() == 2) {
        return run_inventory(store, positional[1]);
    }
    if (command == "get-archive" && positional.size() == 4) {
        return run_get_archive(store, positional[1], positional[2], positional[3]);
    }
    if (command == "delete-archive" && positional.size() == 3) {
        return run_delete_archive(store, positional[1], positional[2]);
    }

    spdlog::error("Unknown command or wrong number of arguments: {}", command);
    print_usage(argv[0]);
    return kExitUsage;
}
