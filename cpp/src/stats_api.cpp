// ─────────────────────────────────────────────────────────────────────────────
// stats_api.cpp  –  REST API Server for Window Statistics
// ─────────────────────────────────────────────────────────────────────────────

#include "stats_api.h"
#include "csv_exporter.h"
#include "errors.h"
#include "iso_time.h"

#include <httplib.h>

#include <cmath>
#include <cstdio>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace regatta {

// ─── Request helpers ────────────────────────────────────────────────────────

static std::vector<BoatId> parse_ids(const std::string& csv) {
    std::vector<BoatId> ids;
    std::stringstream ss(csv);
    std::string token;
    while (std::getline(ss, token, ',')) {
        if (token.empty()) continue;
        ids.push_back(std::stoi(token));
    }
    return ids;
}

static std::vector<BoatId> boat_list(const httplib::Request& req, const char* key) {
    std::vector<BoatId> ids;
    const size_t n = req.get_param_value_count(key);
    for (size_t i = 0; i < n; ++i) {
        auto part = parse_ids(req.get_param_value(key, i));
        ids.insert(ids.end(), part.begin(), part.end());
    }
    if (ids.empty()) {
        throw std::invalid_argument(std::string("'") + key + "' must list at least one boat");
    }
    return ids;
}

static std::optional<int64_t> optional_time(const httplib::Request& req, const char* key) {
    if (!req.has_param(key)) return std::nullopt;
    const std::string value = req.get_param_value(key);
    auto s = parse_iso8601_s(value);
    if (!s) throw std::invalid_argument("Invalid datetime: " + value);
    return s;
}

static int64_t required_time(const httplib::Request& req, const char* key) {
    auto t = optional_time(req, key);
    if (!t) throw std::invalid_argument(std::string(key) + " is required");
    return *t;
}

static RefMode parse_ref(const httplib::Request& req) {
    if (!req.has_param("ref")) return RefMode::TWD;
    const std::string ref = req.get_param_value("ref");
    if (ref == "twd") return RefMode::TWD;
    if (ref == "course" || ref == "mark") return RefMode::COURSE;
    throw std::invalid_argument("ref must be 'twd' or 'course'");
}

static std::optional<int> parse_leg(const httplib::Request& req) {
    if (!req.has_param("legId")) return std::nullopt;
    return std::stoi(req.get_param_value("legId"));
}

static std::optional<double> optional_number(const httplib::Request& req, const char* key) {
    if (!req.has_param(key)) return std::nullopt;
    const double v = std::stod(req.get_param_value(key));
    if (!std::isfinite(v)) {
        throw std::invalid_argument(std::string(key) + " must be a finite number");
    }
    return v;
}

// ─── JSON builders ──────────────────────────────────────────────────────────

static std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

static std::string json_number(const std::optional<double>& v, int decimals) {
    if (!v) return "null";
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, *v);
    return buf;
}

static std::string window_stat_json(const WindowStat& s) {
    char buf[768];
    std::snprintf(buf, sizeof(buf),
        "{"
            "\"boat_id\":%d,"
            "\"t0\":\"%s\",\"t1\":\"%s\","
            "\"ref\":\"%s\","
            "\"avg_sog\":%.3f,"
            "\"avg_vmg\":%s,"
            "\"avg_heading\":%.2f,"
            "\"heading_std\":%.2f,"
            "\"distance_sailed\":%.1f,"
            "\"displacement\":%.1f,"
            "\"height_gain\":%s,"
            "\"tack_count\":%d,"
            "\"gybe_count\":%d,"
            "\"maneuver_count\":%d,"
            "\"sample_count\":%d,"
            "\"wind_fallback\":%s"
        "}",
        s.boat_id,
        format_iso8601(s.t0).c_str(), format_iso8601(s.t1).c_str(),
        ref_mode_str(s.ref),
        s.avg_sog, json_number(s.avg_vmg, 3).c_str(),
        s.avg_heading, s.heading_std,
        s.distance_sailed, s.displacement,
        json_number(s.height_gain, 1).c_str(),
        s.tack_count, s.gybe_count, s.maneuver_count,
        s.sample_count, s.wind_fallback ? "true" : "false");
    return buf;
}

static std::string skipped_json(const std::vector<SkippedBoat>& skipped) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < skipped.size(); ++i) {
        if (i > 0) oss << ",";
        oss << "{\"boat_id\":" << skipped[i].boat_id
            << ",\"reason\":\"" << json_escape(skipped[i].reason) << "\"}";
    }
    oss << "]";
    return oss.str();
}

static std::string event_json(const Event& e) {
    char buf[192];
    std::snprintf(buf, sizeof(buf),
        "{\"boat_id\":%d,\"t\":\"%s\",\"type\":\"%s\",\"heading_change\":%.1f}",
        e.boat_id, format_iso8601(e.t).c_str(), event_type_str(e.type),
        e.heading_change_deg);
    return buf;
}

static std::string report_json(const IngestReport& r) {
    std::ostringstream oss;
    oss << "{\"boat_id\":" << r.boat_id
        << ",\"source\":\"" << json_escape(r.source) << "\""
        << ",\"ok\":" << (r.ok ? "true" : "false")
        << ",\"error\":";
    if (r.ok) oss << "null";
    else oss << "\"" << json_escape(r.error) << "\"";
    oss << ",\"points\":" << r.point_count
        << ",\"events\":" << r.event_count
        << ",\"dropped_fixes\":" << r.dropped_fixes << "}";
    return oss.str();
}

static void send_error(httplib::Response& res, int status, const std::string& detail) {
    res.status = status;
    res.set_content("{\"detail\":\"" + json_escape(detail) + "\"}", "application/json");
}

// Maps request-level failures onto HTTP status codes.
static void guarded(httplib::Response& res, const std::function<void()>& body) {
    try {
        body();
    } catch (const EmptyWindowError& e) {
        send_error(res, 404, e.what());
    } catch (const std::logic_error& e) {
        // std::invalid_argument, std::out_of_range (also from std::stoi)
        send_error(res, 400, e.what());
    }
}

// ─── Server ─────────────────────────────────────────────────────────────────

StatsApi::StatsApi(Ingestor& ingestor, const WindowAggregator& aggregator,
                   const TrackCache& cache, uint16_t port)
    : ingestor_(ingestor), aggregator_(aggregator), cache_(cache), port_(port) {}

StatsApi::~StatsApi() {
    stop();
}

void StatsApi::start() {
    if (running_.exchange(true)) return;
    server_ = std::make_unique<httplib::Server>();
    register_routes();
    thread_ = std::thread(&StatsApi::run, this);
    std::cout << "[StatsApi] HTTP server starting on port " << port_ << "\n";
}

void StatsApi::stop() {
    running_ = false;
    if (server_) server_->stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void StatsApi::register_routes() {
    httplib::Server& svr = *server_;

    svr.set_default_headers({
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type"}
    });

    svr.Post("/api/uploads", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] {
            if (!req.has_param("boat_id")) {
                throw std::invalid_argument("boat_id is required");
            }
            Upload up;
            up.boat_id = std::stoi(req.get_param_value("boat_id"));
            up.label   = req.has_param("label") ? req.get_param_value("label") : "";
            up.source  = req.has_param("filename") ? req.get_param_value("filename")
                                                   : "upload.gpx";
            up.gpx = req.body;
            up.wind.twd_deg = optional_number(req, "twd");
            up.wind.tws_kt  = optional_number(req, "tws");
            up.time_offset_s = optional_number(req, "offset").value_or(0.0);

            auto reports = ingestor_.ingest_batch({up});
            std::ostringstream oss;
            oss << "[";
            for (size_t i = 0; i < reports.size(); ++i) {
                if (i > 0) oss << ",";
                oss << report_json(reports[i]);
            }
            oss << "]";
            res.set_content(oss.str(), "application/json");
        });
    });

    svr.Get("/api/stats", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] {
            auto q = aggregator_.query(boat_list(req, "boats"),
                                       required_time(req, "t0"), required_time(req, "t1"),
                                       parse_ref(req), parse_leg(req));
            std::ostringstream oss;
            oss << "{\"stats\":[";
            for (size_t i = 0; i < q.stats.size(); ++i) {
                if (i > 0) oss << ",";
                oss << window_stat_json(q.stats[i]);
            }
            oss << "],\"skipped\":" << skipped_json(q.skipped) << "}";
            res.set_content(oss.str(), "application/json");
        });
    });

    svr.Get("/api/export/csv", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] {
            CsvExport csv = export_csv(aggregator_, boat_list(req, "boats"),
                                       required_time(req, "t0"), required_time(req, "t1"),
                                       parse_ref(req), parse_leg(req));
            res.set_header("Content-Disposition",
                           "attachment; filename=" + csv.filename);
            res.set_content(csv.body, csv.content_type.c_str());
        });
    });

    svr.Get("/api/compare", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] {
            if (!req.has_param("reference")) {
                throw std::invalid_argument("reference is required");
            }
            auto cmp = aggregator_.compare(std::stoi(req.get_param_value("reference")),
                                           boat_list(req, "targets"),
                                           required_time(req, "t0"), required_time(req, "t1"),
                                           parse_ref(req), parse_leg(req));
            std::ostringstream oss;
            oss << "{\"rows\":[";
            for (size_t i = 0; i < cmp.rows.size(); ++i) {
                const CompareRow& r = cmp.rows[i];
                if (i > 0) oss << ",";
                oss << "{\"reference_boat\":" << r.reference_boat
                    << ",\"target_boat\":" << r.target_boat
                    << ",\"delta_vmg\":" << json_number(r.delta_vmg, 3)
                    << ",\"delta_height\":" << json_number(r.delta_height, 1)
                    << ",\"delta_sog\":" << json_number(r.delta_sog, 3) << "}";
            }
            oss << "],\"skipped\":" << skipped_json(cmp.skipped) << "}";
            res.set_content(oss.str(), "application/json");
        });
    });

    svr.Get("/api/events", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] {
            std::optional<EventType> type;
            if (req.has_param("type")) {
                const std::string t = req.get_param_value("type");
                if (t == "tack") type = EventType::TACK;
                else if (t == "gybe") type = EventType::GYBE;
                else if (t == "maneuver") type = EventType::MANEUVER;
                else throw std::invalid_argument("unknown event type '" + t + "'");
            }
            auto events = aggregator_.events(boat_list(req, "boats"),
                                             optional_time(req, "t0"),
                                             optional_time(req, "t1"), type);
            std::ostringstream oss;
            oss << "[";
            for (size_t i = 0; i < events.size(); ++i) {
                if (i > 0) oss << ",";
                oss << event_json(events[i]);
            }
            oss << "]";
            res.set_content(oss.str(), "application/json");
        });
    });

    svr.Get("/api/tracks", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] {
            int step = 1;
            if (req.has_param("downsample")) {
                const std::string d = req.get_param_value("downsample");
                if (d == "1s") step = 1;
                else if (d == "5s") step = 5;
                else throw std::invalid_argument("Unsupported downsample interval");
            }
            auto tracks = aggregator_.tracks(boat_list(req, "boats"),
                                             optional_time(req, "t0"),
                                             optional_time(req, "t1"), step);
            std::ostringstream oss;
            oss << "[";
            char buf[160];
            for (size_t i = 0; i < tracks.size(); ++i) {
                if (i > 0) oss << ",";
                oss << "{\"boat_id\":" << tracks[i].boat_id << ",\"points\":[";
                for (size_t j = 0; j < tracks[i].points.size(); ++j) {
                    const ResampledPoint& p = tracks[i].points[j];
                    std::snprintf(buf, sizeof(buf),
                        "%s{\"t\":\"%s\",\"lat\":%.7f,\"lon\":%.7f,\"interpolated\":%s}",
                        j > 0 ? "," : "", format_iso8601(p.t).c_str(),
                        p.lat, p.lon, p.interpolated ? "true" : "false");
                    oss << buf;
                }
                oss << "]}";
            }
            oss << "]";
            res.set_content(oss.str(), "application/json");
        });
    });

    svr.Get("/api/boats", [this](const httplib::Request&, httplib::Response& res) {
        std::ostringstream oss;
        oss << "[";
        bool first = true;
        for (BoatId id : cache_.ids()) {
            SeriesPtr s = cache_.find(id);
            if (!s) continue;
            if (!first) oss << ",";
            first = false;
            oss << "{\"boat_id\":" << id
                << ",\"label\":\"" << json_escape(s->label) << "\""
                << ",\"twd\":" << json_number(s->wind.twd_deg, 1)
                << ",\"tws\":" << json_number(s->wind.tws_kt, 1);
            auto span = aggregator_.coverage(id);
            if (span) {
                oss << ",\"t0\":\"" << format_iso8601(span->first) << "\""
                    << ",\"t1\":\"" << format_iso8601(span->second) << "\"";
            }
            oss << ",\"events\":" << s->events.size() << "}";
        }
        oss << "]";
        res.set_content(oss.str(), "application/json");
    });

    svr.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("", "text/plain");
    });
}

void StatsApi::run() {
    if (!server_->listen("0.0.0.0", port_)) {
        if (running_) {
            std::cerr << "[StatsApi] Could not listen on port " << port_ << "\n";
        }
    }
    running_ = false;
}

}  // namespace regatta
