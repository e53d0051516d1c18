#pragma once

#include "detector.hpp"
#include "events.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class IngestStatus {
    Processed,
    Rejected,  // malformed payload or a bar the detector refuses
    Failed     // detector raised while processing
};

struct IngestResult {
    IngestStatus status = IngestStatus::Processed;
    std::vector<DetectionEvent> events;
    std::string error;
};

// Decodes one bar message and feeds it to the detector. Every outcome is
// reported so the caller can acknowledge the message; only InvariantError
// propagates.
IngestResult ingest_bar(Detector& detector, const nlohmann::json& payload);
