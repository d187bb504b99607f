#include "signature_store.h"
#include "../common/error_handler.h"
#include "../common/file_utils.h"
#include "../common/structured_logger.h"

namespace reticle {

SignatureStore SignatureStore::fromFile(const std::string& path) {
    std::string text;
    if (!utils::FileUtils::readFileToString(path, text)) {
        RETICLE_THROW(ErrorType::FILE_IO_ERROR, ErrorSeverity::MEDIUM,
                      "Cannot read recording", path, "SignatureStore::fromFile");
    }

    nlohmann::json recording;
    std::string parseError;
    if (!utils::FileUtils::parseJson(text, recording, parseError)) {
        RETICLE_THROW(ErrorType::SIGNATURE_FORMAT_ERROR, ErrorSeverity::MEDIUM,
                      "Recording is not valid JSON", path + ": " + parseError, "SignatureStore::fromFile");
    }

    SignatureStore store = fromJson(recording);
    store.m_source = path;
    RETICLE_LOG_INFO().component("signature_store").message("Recording loaded")
        .context("path", path)
        .context("entries", store.size());
    return store;
}

SignatureStore SignatureStore::fromJson(const nlohmann::json& recording) {
    SignatureStore store;
    store.m_source = "<memory>";

    if (recording.is_object()) {
        store.m_signatures.push_back(ElementSignature::fromJson(recording));
        return store;
    }
    if (!recording.is_array()) {
        RETICLE_THROW(ErrorType::SIGNATURE_FORMAT_ERROR, ErrorSeverity::MEDIUM,
                      "Recording must be an array of entries or a single entry", "",
                      "SignatureStore::fromJson");
    }

    store.m_signatures.reserve(recording.size());
    for (size_t i = 0; i < recording.size(); ++i) {
        try {
            store.m_signatures.push_back(ElementSignature::fromJson(recording[i]));
        } catch (const ReticleException& e) {
            ErrorInfo info = e.getErrorInfo();
            info.details = "entry " + std::to_string(i) + (info.details.empty() ? "" : ": " + info.details);
            throw ReticleException(info);
        }
    }
    return store;
}

const ElementSignature& SignatureStore::at(size_t index) const {
    if (index >= m_signatures.size()) {
        RETICLE_THROW(ErrorType::VALIDATION_ERROR, ErrorSeverity::LOW,
                      "Recording entry index out of range",
                      std::to_string(index) + " of " + std::to_string(m_signatures.size()),
                      "SignatureStore::at");
    }
    return m_signatures[index];
}

const ElementSignature& SignatureStore::select(std::optional<int> index) const {
    if (m_signatures.empty()) {
        RETICLE_THROW(ErrorType::VALIDATION_ERROR, ErrorSeverity::LOW,
                      "Recording has no entries", m_source, "SignatureStore::select");
    }

    int count = static_cast<int>(m_signatures.size());
    int resolved = index.value_or(count - 1);
    if (resolved < 0 || resolved >= count) {
        RETICLE_THROW(ErrorType::VALIDATION_ERROR, ErrorSeverity::LOW,
                      "Recording entry index out of range",
                      std::to_string(resolved) + " of " + std::to_string(count),
                      "SignatureStore::select");
    }
    return m_signatures[static_cast<size_t>(resolved)];
}

} // namespace reticle
