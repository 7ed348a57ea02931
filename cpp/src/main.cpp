// ─────────────────────────────────────────────────────────────────────────────
// main.cpp  –  Regatta Stats: GPX Ingestion & Window Statistics
//
// Brings together all components:
//   1. Read the GPX logs named on the command line
//   2. Ingest them in parallel (parse, resample, kinematics, events)
//   3. Either write the window statistics as CSV
//   4. Or expose everything via the REST API until interrupted
// ─────────────────────────────────────────────────────────────────────────────

#include "csv_exporter.h"
#include "ingestor.h"
#include "iso_time.h"
#include "stats_api.h"
#include "track_cache.h"
#include "window_aggregator.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

struct GpxArg {
    int boat_id = 0;
    std::string path;
};

struct Config {
    std::vector<GpxArg> gpx;
    std::map<int, double> offsets;
    std::vector<regatta::CourseMark> marks;
    regatta::WindReference wind;
    regatta::PipelineConfig pipeline;

    std::string t0, t1;                      // ISO-8601, empty = full span
    regatta::RefMode ref = regatta::RefMode::TWD;
    int leg_id = -1;
    bool exclude_interpolated = false;
    std::string out_path = "window_stats.csv";   // "-" = stdout

    bool serve = false;
    uint16_t api_port = 8080;
};

static std::atomic<bool> g_stop{false};

static void on_signal(int) { g_stop = true; }

static void print_usage(const char* prog) {
    std::cout
        << "Usage: " << prog << " [OPTIONS]\n"
        << "\n"
        << "Required:\n"
        << "  --gpx ID=PATH        GPX log for boat ID (repeatable)\n"
        << "\n"
        << "Wind & course:\n"
        << "  --twd DEG            True wind direction (omit for fallback mode)\n"
        << "  --tws KT             True wind speed\n"
        << "  --offset ID=SEC      Clock offset added to boat ID's fixes\n"
        << "  --mark ID,LAT,LON    Course mark usable as --leg (repeatable)\n"
        << "\n"
        << "Window:\n"
        << "  --t0 ISO             Window start (default: first sample)\n"
        << "  --t1 ISO             Window end, exclusive (default: last sample)\n"
        << "  --ref twd|course     VMG reference (default: twd)\n"
        << "  --leg ID             Course mark for --ref course\n"
        << "  --exclude-gaps       Ignore samples inside long GPS gaps\n"
        << "  --out FILE           CSV destination, '-' for stdout (default: window_stats.csv)\n"
        << "\n"
        << "Pipeline tuning:\n"
        << "  --smooth N           Smoothing window in seconds (default: 5)\n"
        << "  --ema                Exponential instead of moving-average smoothing\n"
        << "  --dwell S            Tack/gybe dwell time (default: 3)\n"
        << "  --cooldown S         Event cooldown (default: 5)\n"
        << "  --gap S              Gap threshold for interpolated tags (default: 30)\n"
        << "  --jitter S           Backward timestamp tolerance (default: 1)\n"
        << "  --max-span S         Longest accepted track (default: 604800)\n"
        << "  --derived-sog        Ignore logged <speed>, derive SOG from positions\n"
        << "\n"
        << "Server:\n"
        << "  --serve              Start the REST API instead of printing CSV\n"
        << "  --api-port PORT      REST API port (default: 8080)\n"
        << "  -h, --help           Show this help\n";
}

// "ID=VALUE"
static std::pair<int, std::string> split_id(const std::string& arg) {
    const auto eq = arg.find('=');
    if (eq == std::string::npos) {
        throw std::invalid_argument("expected ID=VALUE, got '" + arg + "'");
    }
    return {std::stoi(arg.substr(0, eq)), arg.substr(eq + 1)};
}

static regatta::CourseMark parse_mark(const std::string& arg) {
    std::stringstream ss(arg);
    std::string id, lat, lon;
    if (!std::getline(ss, id, ',') || !std::getline(ss, lat, ',') ||
        !std::getline(ss, lon, ',')) {
        throw std::invalid_argument("expected ID,LAT,LON, got '" + arg + "'");
    }
    regatta::CourseMark m;
    m.id = std::stoi(id);
    m.lat = std::stod(lat);
    m.lon = std::stod(lon);
    m.name = "mark " + id;
    return m;
}

static double finite_number(const std::string& text, const char* flag) {
    const double v = std::stod(text);
    if (!std::isfinite(v)) {
        throw std::invalid_argument(std::string(flag) + " must be a finite number");
    }
    return v;
}

static Config parse_args(int argc, char** argv) {
    Config cfg;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--gpx" && i + 1 < argc) {
            auto kv = split_id(argv[++i]);
            cfg.gpx.push_back({kv.first, kv.second});
        } else if (arg == "--twd" && i + 1 < argc) {
            cfg.wind.twd_deg = finite_number(argv[++i], "--twd");
        } else if (arg == "--tws" && i + 1 < argc) {
            cfg.wind.tws_kt = finite_number(argv[++i], "--tws");
        } else if (arg == "--offset" && i + 1 < argc) {
            auto kv = split_id(argv[++i]);
            cfg.offsets[kv.first] = finite_number(kv.second, "--offset");
        } else if (arg == "--mark" && i + 1 < argc) {
            cfg.marks.push_back(parse_mark(argv[++i]));
        } else if (arg == "--t0" && i + 1 < argc) {
            cfg.t0 = argv[++i];
        } else if (arg == "--t1" && i + 1 < argc) {
            cfg.t1 = argv[++i];
        } else if (arg == "--ref" && i + 1 < argc) {
            std::string ref = argv[++i];
            if (ref == "twd") cfg.ref = regatta::RefMode::TWD;
            else if (ref == "course") cfg.ref = regatta::RefMode::COURSE;
            else throw std::invalid_argument("--ref must be twd or course");
        } else if (arg == "--leg" && i + 1 < argc) {
            cfg.leg_id = std::stoi(argv[++i]);
        } else if (arg == "--exclude-gaps") {
            cfg.exclude_interpolated = true;
        } else if (arg == "--out" && i + 1 < argc) {
            cfg.out_path = argv[++i];
        } else if (arg == "--smooth" && i + 1 < argc) {
            cfg.pipeline.kinematics.smoothing_window_s = std::stoi(argv[++i]);
        } else if (arg == "--ema") {
            cfg.pipeline.kinematics.mode = regatta::SmoothingMode::EXPONENTIAL;
        } else if (arg == "--dwell" && i + 1 < argc) {
            cfg.pipeline.detector.dwell_s = std::stod(argv[++i]);
        } else if (arg == "--cooldown" && i + 1 < argc) {
            cfg.pipeline.detector.cooldown_s = std::stod(argv[++i]);
        } else if (arg == "--gap" && i + 1 < argc) {
            cfg.pipeline.resampler.gap_threshold_s = std::stod(argv[++i]);
        } else if (arg == "--max-span" && i + 1 < argc) {
            cfg.pipeline.resampler.max_span_s = finite_number(argv[++i], "--max-span");
        } else if (arg == "--derived-sog") {
            cfg.pipeline.kinematics.prefer_device_sog = false;
        } else if (arg == "--jitter" && i + 1 < argc) {
            cfg.pipeline.parser.backward_tolerance_s = std::stod(argv[++i]);
        } else if (arg == "--serve") {
            cfg.serve = true;
        } else if (arg == "--api-port" && i + 1 < argc) {
            cfg.api_port = static_cast<uint16_t>(std::stoi(argv[++i]));
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }
    if (cfg.gpx.empty() && !cfg.serve) {
        std::cerr << "Error: at least one --gpx is required\n\n";
        print_usage(argv[0]);
        std::exit(1);
    }
    return cfg;
}

static bool read_file(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return false;
    std::ostringstream ss;
    ss << file.rdbuf();
    out = ss.str();
    return true;
}

static bool to_epoch_s(const std::string& iso, int64_t& out) {
    auto s = regatta::parse_iso8601_s(iso);
    if (!s) {
        std::cerr << "Error: invalid ISO-8601 time '" << iso << "'\n";
        return false;
    }
    out = *s;
    return true;
}

int main(int argc, char** argv) {
    Config cfg;
    try {
        cfg = parse_args(argc, argv);
    } catch (const std::logic_error& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage(argv[0]);
        return 1;
    }

    // ── 1. Read GPX Logs ────────────────────────────────────────────────
    int failed = 0;
    std::vector<regatta::Upload> uploads;
    for (const auto& g : cfg.gpx) {
        regatta::Upload up;
        up.boat_id = g.boat_id;
        up.source  = g.path;
        up.wind    = cfg.wind;
        auto off = cfg.offsets.find(g.boat_id);
        if (off != cfg.offsets.end()) up.time_offset_s = off->second;
        if (!read_file(g.path, up.gpx)) {
            std::cerr << "[Main] Cannot open " << g.path << "\n";
            failed++;
            continue;
        }
        uploads.push_back(std::move(up));
    }

    // ── 2. Ingest ───────────────────────────────────────────────────────
    regatta::TrackCache cache;
    std::unique_ptr<regatta::Ingestor> ingestor;
    try {
        ingestor = std::make_unique<regatta::Ingestor>(cache, cfg.pipeline);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    for (const auto& r : ingestor->ingest_batch(uploads)) {
        if (r.ok) {
            std::cout << "[Main] " << r.source << " -> boat " << r.boat_id << " ("
                      << r.point_count << " s, " << r.event_count << " events)\n";
        } else {
            std::cerr << "[Main] " << r.source << " failed: " << r.error << "\n";
            failed++;
        }
    }

    regatta::WindowAggregator aggregator(cache, cfg.marks);

    // ── 3. Serve ────────────────────────────────────────────────────────
    if (cfg.serve) {
        regatta::StatsApi api(*ingestor, aggregator, cache, cfg.api_port);
        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);
        api.start();
        std::cout << "[Main] Serving " << cache.size() << " boats (Ctrl-C to quit)\n";
        while (!g_stop) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        api.stop();
        return 0;
    }

    // ── 4. Window CSV ───────────────────────────────────────────────────
    std::vector<regatta::BoatId> ids = cache.ids();
    if (ids.empty()) {
        std::cerr << "[Main] No boat could be ingested\n";
        return 1;
    }

    int64_t t0 = std::numeric_limits<int64_t>::max();
    int64_t t1 = std::numeric_limits<int64_t>::min();
    for (auto id : ids) {
        auto span = aggregator.coverage(id);
        if (!span) continue;
        t0 = std::min(t0, span->first);
        t1 = std::max(t1, span->second);
    }
    if (!cfg.t0.empty() && !to_epoch_s(cfg.t0, t0)) return 1;
    if (!cfg.t1.empty() && !to_epoch_s(cfg.t1, t1)) return 1;

    std::optional<int> leg;
    if (cfg.leg_id >= 0) leg = cfg.leg_id;

    regatta::QueryOptions opts;
    opts.exclude_interpolated = cfg.exclude_interpolated;

    regatta::QueryResult q;
    try {
        q = aggregator.query(ids, t0, t1, cfg.ref, leg, opts);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    for (const auto& s : q.skipped) {
        std::cerr << "[Main] boat " << s.boat_id << " skipped: " << s.reason << "\n";
    }

    const std::string csv = regatta::CsvExporter::write(q.stats);
    if (cfg.out_path == "-") {
        std::cout << csv;
    } else {
        std::ofstream out(cfg.out_path, std::ios::binary);
        if (!out.is_open() || !(out << csv)) {
            std::cerr << "[Main] Cannot write " << cfg.out_path << "\n";
            return 1;
        }
        std::cout << "[Main] Wrote " << q.stats.size() << " rows to " << cfg.out_path << "\n";
    }
    return failed > 0 ? 2 : 0;
}
