#ifndef RETICLE_SIGNATURE_STORE_H
#define RETICLE_SIGNATURE_STORE_H

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "element_signature.h"

namespace reticle {

/**
 * @brief Read-only view of a recording file
 *
 * A recording is a JSON array with one entry per recorded interaction, or a
 * single entry object. Every entry is validated when the store is loaded.
 */
class SignatureStore {
public:
    /**
     * @throws ReticleException (FILE_IO_ERROR or SIGNATURE_FORMAT_ERROR)
     */
    static SignatureStore fromFile(const std::string& path);

    /**
     * @throws ReticleException (SIGNATURE_FORMAT_ERROR); details name the
     *         offending entry index
     */
    static SignatureStore fromJson(const nlohmann::json& recording);

    size_t size() const { return m_signatures.size(); }
    bool empty() const { return m_signatures.empty(); }

    /**
     * @throws ReticleException (VALIDATION_ERROR) if index is out of range
     */
    const ElementSignature& at(size_t index) const;

    /**
     * @brief Pick an entry; defaults to the most recent one
     *
     * @throws ReticleException (VALIDATION_ERROR) if the store is empty or
     *         the index is negative or out of range
     */
    const ElementSignature& select(std::optional<int> index = std::nullopt) const;

    const std::string& source() const { return m_source; }

private:
    SignatureStore() = default;

    std::vector<ElementSignature> m_signatures;
    std::string m_source;
};

} // namespace reticle

#endif // RETICLE_SIGNATURE_STORE_H
