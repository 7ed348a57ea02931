#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// errors.h  –  Track Pipeline Error Taxonomy
//
//   MalformedTrackError  invalid raw fixes, reject that file
//   EmptyTrackError      too short to resample, reject that boat
//   EmptyWindowError     no samples in a query window, skip that boat
//
// Missing wind is never an error; it degrades VMG / height gain / events.
// ─────────────────────────────────────────────────────────────────────────────

#include <stdexcept>
#include <string>

namespace regatta {

class TrackError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class MalformedTrackError : public TrackError {
public:
    using TrackError::TrackError;
};

class EmptyTrackError : public TrackError {
public:
    using TrackError::TrackError;
};

class EmptyWindowError : public TrackError {
public:
    using TrackError::TrackError;
};

}  // namespace regatta
