// ─────────────────────────────────────────────────────────────────────────────
// gpx_reader.cpp  –  GPX Track Decoder (pugixml)
// ─────────────────────────────────────────────────────────────────────────────

#include "gpx_reader.h"
#include "errors.h"
#include "iso_time.h"

#include <pugixml.hpp>

#include <cmath>
#include <cstdlib>
#include <string>

namespace regatta {

static bool parse_double(const char* text, double& out) {
    if (text == nullptr || *text == '\0') return false;
    char* end = nullptr;
    out = std::strtod(text, &end);
    while (end && (*end == ' ' || *end == '\t' || *end == '\n' || *end == '\r')) ++end;
    return end != text && end && *end == '\0';
}

static std::string trimmed(const char* text) {
    std::string s(text);
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

GpxTrack read_gpx(const std::string& xml) {
    pugi::xml_document doc;
    auto status = doc.load_string(xml.c_str());
    if (!status) {
        throw MalformedTrackError(std::string("could not parse GPX: ") +
                                  status.description());
    }

    pugi::xml_node root = doc.child("gpx");
    if (!root) {
        throw MalformedTrackError("document has no <gpx> root element");
    }

    GpxTrack out;
    for (pugi::xml_node trk = root.child("trk"); trk; trk = trk.next_sibling("trk")) {
        if (out.name.empty()) out.name = trk.child_value("name");

        for (pugi::xml_node seg = trk.child("trkseg"); seg; seg = seg.next_sibling("trkseg")) {
            for (pugi::xml_node pt = seg.child("trkpt"); pt; pt = pt.next_sibling("trkpt")) {
                pugi::xml_node time_node = pt.child("time");
                if (!time_node) {
                    out.skipped_untimed++;
                    continue;
                }

                RawFix fix;
                if (!parse_double(pt.attribute("lat").value(), fix.lat) ||
                    !parse_double(pt.attribute("lon").value(), fix.lon)) {
                    throw MalformedTrackError(
                        std::string("trkpt with undecodable coordinates at offset ") +
                        std::to_string(pt.offset_debug()));
                }

                auto t = parse_iso8601_ms(trimmed(time_node.child_value()));
                if (!t) {
                    throw MalformedTrackError(std::string("trkpt with invalid time '") +
                                              time_node.child_value() + "'");
                }
                fix.t_ms = *t;

                double ele;
                if (parse_double(pt.child_value("ele"), ele)) fix.ele = ele;

                double speed;
                if (parse_double(pt.child_value("speed"), speed) &&
                    std::isfinite(speed) && speed >= 0.0) {
                    fix.speed_mps = speed;
                }

                out.fixes.push_back(fix);
            }
        }
    }
    return out;
}

}  // namespace regatta
