#define _FILE_OFFSET_BITS 64

#include "blte/blte_decoder.hpp"
#include "blte/blte_encoder.hpp"
#include "blte/espec.hpp"
#include "casc/archive_store.hpp"
#include "cdn/download_manager.hpp"
#include "cdn/http_transport.hpp"
#include "crypto/key_store.hpp"
#include "install/install_orchestrator.hpp"
#include "install/progress_sinks.hpp"
#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "system/signals.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "util/manifest_parser.hpp"
#include "util/path_utils.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <memory>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;
constexpr int kExitPartial = 3;
constexpr int kExitCancelled = 4;
constexpr int kExitAborted = 5;

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s install -c <config.json> -m <manifest.json> [-t <tag>]... [-v]\n"
        "   %s decode  -i <in|-> -o <out|-> [-k <keyfile>] [--zero-fill] [-v]\n"
        "   %s encode  -i <in|-> -o <out|-> -s <espec> [-k <keyfile>] [-v]\n"
        "   %s read    -d <install_dir> -e <ekey> -o <out|-> [--decode] [-k <keyfile>] [-v]\n"
        "   %s verify  -d <install_dir> [-v]\n"
        "\n"
        "Options:\n"
        "  -c, --config      Client configuration (JSON)\n"
        "  -m, --manifest    Install manifest (JSON)\n"
        "  -t, --tag         Only install entries carrying this tag; repeatable, overrides config tags\n"
        "  -i, --input       Input file path or '-' for stdin\n"
        "  -o, --output      Output file path or '-' for stdout\n"
        "  -s, --espec       Encoding spec, e.g. 'z' or 'b:{256K*=z}'\n"
        "  -k, --keys        Decryption key file (KEYNAME KEY hex per line)\n"
        "  -d, --dir         Install directory\n"
        "  -e, --ekey        Encoded key (32 hex digits)\n"
        "  -v, --verbose     Debug logging\n"
        "  -h, --help        Show this help\n",
        argv, argv, argv, argv, argv);
}

struct CliArgs {
    std::string config;
    std::string manifest;
    std::vector<std::string> tags;
    std::string input;
    std::string output;
    std::string espec;
    std::string keys;
    std::string dir;
    std::string ekey;
    bool zero_fill = false;
    bool decode = false;
    bool verbose = false;
};

// Returns -1 to continue, otherwise an exit code.
int ParseArgs(int argc, char **argv, const char *prog, CliArgs &args) {
    enum { kZeroFill = 1000, kDecode };
    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"manifest", required_argument, nullptr, 'm'},
        {"tag", required_argument, nullptr, 't'},
        {"input", required_argument, nullptr, 'i'},
        {"output", required_argument, nullptr, 'o'},
        {"espec", required_argument, nullptr, 's'},
        {"keys", required_argument, nullptr, 'k'},
        {"dir", required_argument, nullptr, 'd'},
        {"ekey", required_argument, nullptr, 'e'},
        {"zero-fill", no_argument, nullptr, kZeroFill},
        {"decode", no_argument, nullptr, kDecode},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    optind = 1;
    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hvc:m:t:i:o:s:k:d:e:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(prog);
                return kExitOk;
            case 'v': args.verbose = true; break;
            case 'c': args.config = optarg; break;
            case 'm': args.manifest = optarg; break;
            case 't': args.tags.emplace_back(optarg); break;
            case 'i': args.input = optarg; break;
            case 'o': args.output = optarg; break;
            case 's': args.espec = optarg; break;
            case 'k': args.keys = optarg; break;
            case 'd': args.dir = optarg; break;
            case 'e': args.ekey = optarg; break;
            case kZeroFill: args.zero_fill = true; break;
            case kDecode: args.decode = true; break;
            default:
                PrintUsage(prog);
                return kExitUsage;
        }
    }
    if (optind != argc) {
        std::fprintf(stderr, "Unexpected argument: %s\n", argv[optind]);
        return kExitUsage;
    }
    return -1;
}

bool LoadKeys(const std::string &path, ngdp::MemoryKeyStore &keys) {
    if (path.empty()) return true;
    auto r = keys.LoadFromFile(path);
    if (!r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return false;
    }
    LogInfo("Loaded %zu decryption key(s) from %s", keys.Size(), path.c_str());
    return true;
}

int WriteOutput(const std::string &path, std::span<const std::uint8_t> data) {
    ngdp::FileOrStdoutWriter writer;
    auto r = ngdp::FileOrStdoutWriter::Open(path, writer);
    if (r.ok) r = writer.WriteAll(data);
    if (r.ok) r = writer.FsyncNow();
    if (!r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return kExitError;
    }
    return kExitOk;
}

int CmdInstall(const CliArgs &args, const char *prog) {
    if (args.config.empty() || args.manifest.empty()) {
        PrintUsage(prog);
        return kExitUsage;
    }

    ngdp::config::ClientConfig cfg;
    if (auto r = cfg.LoadFile(args.config); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return kExitError;
    }
    if (!args.verbose) {
        ngdp::Logger::Instance().SetLevel(*ngdp::ParseLogLevel(cfg.log_level));
    }
    ngdp::Logger::Instance().SetThreadTags(true);

    auto manifest = ngdp::ManifestParser{}.ParseFile(args.manifest);
    if (!manifest) {
        std::fprintf(stderr, "ERROR: manifest %s: %s\n", args.manifest.c_str(), manifest.error().c_str());
        return kExitError;
    }

    ngdp::MemoryKeyStore keys;
    if (!LoadKeys(args.keys.empty() ? cfg.key_file : args.keys, keys)) return kExitError;

    ngdp::casc::ArchiveStoreOptions store_opt;
    store_opt.max_data_file_size = cfg.max_data_file_size;
    store_opt.verify_on_read = cfg.verify_on_read;
    std::unique_ptr<ngdp::casc::ArchiveStore> store;
    if (auto r = ngdp::casc::ArchiveStore::Open(cfg.DataDir(), store_opt, store); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return kExitError;
    }

    ngdp::cdn::DownloadOptions dl_opt;
    dl_opt.hosts = cfg.cdn_hosts;
    dl_opt.cdn_path = cfg.cdn_path;
    dl_opt.max_attempts = cfg.max_attempts;
    dl_opt.initial_backoff = std::chrono::milliseconds(cfg.initial_backoff_ms);
    dl_opt.max_backoff = std::chrono::milliseconds(cfg.max_backoff_ms);
    dl_opt.max_in_flight = cfg.max_in_flight;
    dl_opt.connect_timeout_s = static_cast<long>(cfg.connect_timeout_s);
    dl_opt.request_timeout_s = static_cast<long>(cfg.request_timeout_s);

    ngdp::cdn::CurlTransport transport;
    ngdp::cdn::DownloadManager downloads(transport, dl_opt, ngdp::g_cancel);

    ngdp::MultiProgress progress;
    ngdp::ConsoleProgressSink console;
    std::unique_ptr<ngdp::FileProgressSink> file_sink;
    if (::isatty(STDERR_FILENO)) progress.Add(&console);
    if (!cfg.progress_file.empty()) {
        file_sink = std::make_unique<ngdp::FileProgressSink>(cfg.progress_file);
        progress.Add(file_sink.get());
    }

    ngdp::InstallOptions opt;
    opt.workers = cfg.workers;
    opt.tags = args.tags.empty() ? cfg.tags : args.tags;
    opt.progress_path = cfg.ProgressRecordPath();

    ngdp::InstallOrchestrator orchestrator(*store, downloads, keys, opt, ngdp::g_cancel,
                                           progress.Empty() ? nullptr : &progress);
    ngdp::InstallReport report;
    if (auto r = orchestrator.Run(*manifest, report); !r.ok) {
        ngdp::ClearProgressLine();
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return kExitError;
    }
    ngdp::ClearProgressLine();

    for (const auto &k : report.keys) {
        if (k.state != ngdp::KeyState::Errored) continue;
        std::fprintf(stderr, "FAILED %s %s: [%s] %s\n", k.ekey.Hex().c_str(), k.name.c_str(),
                     ngdp::ToString(k.error.kind()), k.error.msg.c_str());
    }

    switch (report.outcome) {
        case ngdp::SessionOutcome::Completed:       return kExitOk;
        case ngdp::SessionOutcome::PartiallyFailed: return kExitPartial;
        case ngdp::SessionOutcome::Cancelled:       return kExitCancelled;
        case ngdp::SessionOutcome::Aborted:         return kExitAborted;
    }
    return kExitError;
}

int CmdDecode(const CliArgs &args, const char *prog) {
    if (args.input.empty() || args.output.empty()) {
        PrintUsage(prog);
        return kExitUsage;
    }

    ngdp::MemoryKeyStore keys;
    if (!LoadKeys(args.keys, keys)) return kExitError;

    auto source = std::make_unique<ngdp::FileOrStdinReader>();
    if (auto r = ngdp::FileOrStdinReader::Open(args.input, *source); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return kExitError;
    }

    ngdp::FileOrStdoutWriter writer;
    if (auto r = ngdp::FileOrStdoutWriter::Open(args.output, writer); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return kExitError;
    }

    ngdp::blte::DecodeOptions opt;
    if (args.zero_fill) opt.missing_key = ngdp::blte::MissingKeyPolicy::ZeroFill;
    ngdp::blte::BlteReader reader(std::move(source), keys, opt);

    std::vector<std::uint8_t> buf(1024 * 1024);
    while (!ngdp::g_cancel.load(std::memory_order_relaxed)) {
        const ssize_t n = reader.Read(buf);
        if (n < 0) {
            std::fprintf(stderr, "ERROR: %s: %s\n", ngdp::ToString(reader.Status().code),
                         reader.Status().msg.c_str());
            return kExitError;
        }
        if (n == 0) break;
        if (auto r = writer.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n))); !r.ok) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return kExitError;
        }
    }
    if (ngdp::g_cancel.load(std::memory_order_relaxed)) {
        std::fprintf(stderr, "Cancelled\n");
        return kExitCancelled;
    }
    if (auto r = writer.FsyncNow(); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return kExitError;
    }

    if (!reader.Status().ok) {
        std::fprintf(stderr, "WARN: %s (chunks:", reader.Status().msg.c_str());
        for (auto i : reader.MissingKeyChunks()) std::fprintf(stderr, " %u", i);
        std::fprintf(stderr, ")\n");
        return kExitPartial;
    }
    return kExitOk;
}

int CmdEncode(const CliArgs &args, const char *prog) {
    if (args.input.empty() || args.output.empty() || args.espec.empty()) {
        PrintUsage(prog);
        return kExitUsage;
    }

    auto spec = ngdp::blte::ParseEspec(args.espec);
    if (!spec) {
        std::fprintf(stderr, "ERROR: %s\n", spec.error().c_str());
        return kExitUsage;
    }

    ngdp::MemoryKeyStore keys;
    if (!LoadKeys(args.keys, keys)) return kExitError;

    std::vector<std::uint8_t> content;
    if (auto r = ngdp::ReadFileToVector(args.input, content); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return kExitError;
    }

    std::vector<std::uint8_t> encoded;
    ngdp::blte::BlteEncoder encoder(keys);
    if (auto r = encoder.Encode(content, *spec, encoded); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return kExitError;
    }

    ngdp::EKey ekey;
    if (auto r = ngdp::blte::ComputeEKey(encoded, ekey); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return kExitError;
    }
    LogInfo("Encoded %zu -> %zu bytes with %s, ekey %s", content.size(), encoded.size(),
            ngdp::blte::FormatEspec(*spec).c_str(), ekey.Hex().c_str());

    return WriteOutput(args.output, encoded);
}

int CmdRead(const CliArgs &args, const char *prog) {
    if (args.dir.empty() || args.ekey.empty() || args.output.empty()) {
        PrintUsage(prog);
        return kExitUsage;
    }
    auto ekey = ngdp::EKey::FromHex(args.ekey);
    if (!ekey) {
        std::fprintf(stderr, "Invalid --ekey: %s\n", args.ekey.c_str());
        return kExitUsage;
    }

    std::unique_ptr<ngdp::casc::ArchiveStore> store;
    const std::string data_dir = ngdp::JoinPath(ngdp::JoinPath(args.dir, "Data"), "data");
    ngdp::casc::ArchiveStoreOptions store_opt;
    store_opt.recover = false;
    if (auto r = ngdp::casc::ArchiveStore::Open(data_dir, store_opt, store); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return kExitError;
    }

    std::vector<std::uint8_t> encoded;
    if (auto r = store->Read(*ekey, encoded); !r.ok) {
        std::fprintf(stderr, "ERROR: %s: %s\n", ngdp::ToString(r.code), r.msg.c_str());
        return kExitError;
    }
    if (!args.decode) return WriteOutput(args.output, encoded);

    ngdp::MemoryKeyStore keys;
    if (!LoadKeys(args.keys, keys)) return kExitError;
    std::vector<std::uint8_t> content;
    ngdp::blte::BlteDecoder decoder(keys);
    if (auto r = decoder.Decode(encoded, content); !r.ok) {
        std::fprintf(stderr, "ERROR: %s: %s\n", ngdp::ToString(r.code), r.msg.c_str());
        return kExitError;
    }
    return WriteOutput(args.output, content);
}

int CmdVerify(const CliArgs &args, const char *prog) {
    if (args.dir.empty()) {
        PrintUsage(prog);
        return kExitUsage;
    }

    std::unique_ptr<ngdp::casc::ArchiveStore> store;
    const std::string data_dir = ngdp::JoinPath(ngdp::JoinPath(args.dir, "Data"), "data");
    ngdp::casc::ArchiveStoreOptions store_opt;
    store_opt.recover = false;
    if (auto r = ngdp::casc::ArchiveStore::Open(data_dir, store_opt, store); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return kExitError;
    }

    const auto report = store->VerifyAll();
    for (const auto &f : report.failures) std::fprintf(stderr, "CORRUPT %s\n", f.c_str());
    std::fprintf(stderr, "%zu entries checked, %zu corrupt\n", report.checked, report.failures.size());
    return report.failures.empty() ? kExitOk : kExitError;
}

} // namespace

int main(int argc, char **argv) {
    ngdp::InstallSignalHandlers();

    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        PrintUsage(argv[0]);
        return argc < 2 ? kExitUsage : kExitOk;
    }

    const std::string cmd = argv[1];
    CliArgs args;
    if (int rc = ParseArgs(argc - 1, argv + 1, argv[0], args); rc >= 0) return rc;
    if (args.verbose) ngdp::Logger::Instance().SetLevel(ngdp::LogLevel::Debug);

    if (cmd == "install") return CmdInstall(args, argv[0]);
    if (cmd == "decode") return CmdDecode(args, argv[0]);
    if (cmd == "encode") return CmdEncode(args, argv[0]);
    if (cmd == "read") return CmdRead(args, argv[0]);
    if (cmd == "verify") return CmdVerify(args, argv[0]);

    std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
    PrintUsage(argv[0]);
    return kExitUsage;
}
