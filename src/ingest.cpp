#include "ingest.hpp"
#include "errors.hpp"

IngestResult ingest_bar(Detector& detector, const nlohmann::json& payload) {
    IngestResult result;
    try {
        Bar bar = Bar::from_json(payload);
        result.events = detector.process_bar(bar);
    } catch (const BarOrderError& e) {
        result.status = IngestStatus::Rejected;
        result.error = e.what();
    } catch (const nlohmann::json::exception& e) {
        result.status = IngestStatus::Rejected;
        result.error = std::string("malformed bar: ") + e.what();
    } catch (const InvariantError&) {
        throw;
    } catch (const std::exception& e) {
        result.status = IngestStatus::Failed;
        result.error = e.what();
    }
    return result;
}
