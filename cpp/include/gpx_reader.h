#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// gpx_reader.h  –  GPX Track Decoder
//
// Collects every <trk>/<trkseg>/<trkpt> of a GPX 1.0 / 1.1 document:
//   <trkpt lat=".." lon=".."><ele>..</ele><time>ISO-8601</time></trkpt>
// Points without <time> are skipped.  A GPX 1.0 <speed> (m/s) is kept as the
// device SOG; negative or unreadable values are ignored.
// ─────────────────────────────────────────────────────────────────────────────

#include "track_types.h"

#include <string>
#include <vector>

namespace regatta {

struct GpxTrack {
    std::string name;             // first <trk><name>, may be empty
    std::vector<RawFix> fixes;    // document order
    int skipped_untimed = 0;
};

/// Throws MalformedTrackError when the XML does not parse, has no <gpx>
/// root, or a timed point has undecodable coordinates / time.
GpxTrack read_gpx(const std::string& xml);

}  // namespace regatta
