#include "../../include/events.hpp"

namespace inkpress {

const char* stage_to_string(const PipelineStage stage) noexcept {
    switch (stage) {
        case PipelineStage::Validate:          return "Validate";
        case PipelineStage::Extract:           return "Extract";
        case PipelineStage::ParseOPF:          return "ParseOPF";
        case PipelineStage::TrimSpine:         return "TrimSpine";
        case PipelineStage::StripImages:       return "StripImages";
        case PipelineStage::ReplaceStylesheet: return "ReplaceStylesheet";
        case PipelineStage::RewriteNavigation: return "RewriteNavigation";
        case PipelineStage::EmbedDiagnostics:  return "EmbedDiagnostics";
        case PipelineStage::SerializeOPF:      return "SerializeOPF";
        case PipelineStage::Repack:            return "Repack";
        case PipelineStage::Finalize:          return "Finalize";
    }
    return "Unknown";
}

} // namespace inkpress
