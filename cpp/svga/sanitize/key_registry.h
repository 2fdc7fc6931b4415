#ifndef SVGA_SANITIZE_KEY_REGISTRY_H
#define SVGA_SANITIZE_KEY_REGISTRY_H

#include "svga/core/types.h"
#include "svga/model/document.h"

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace svga {

// One-to-one mapping from original asset keys to sanitized wire names.
//
// Keys that are already clean keep their name. A key whose sanitized form is taken by an
// earlier registration gets the first free "_<n>" suffix (n starting at 2) and a
// KeyCollision warning.
class KeyRegistry {
public:
    // Returns the wire name assigned to `original`. Registering the same key twice
    // returns the same name.
    const std::string& registerKey(const std::string& original, std::vector<RepairWarning>* warnings);

    // Wire name for a reference: the registered name, or the sanitized reference when
    // the key was never registered. Empty stays empty.
    std::string resolve(const std::string& reference) const;

    bool isAssigned(const std::string& wireName) const { return assigned_.count(wireName) != 0; }
    std::size_t size() const noexcept { return mapping_.size(); }

private:
    std::unordered_map<std::string, std::string> mapping_;
    std::unordered_set<std::string> assigned_;
};

/**
 * Normalize a document for the wire.
 *
 * - Image keys are sanitized through a KeyRegistry; images become raw bytes. Empty or
 *   undecodable data is replaced by the fallback PNG (InvalidRasterData).
 * - Sprite imageKey / matteKey are remapped. A non-empty key with no image gets the
 *   fallback PNG inserted under it (InvalidReference).
 * - Audio keys are remapped; audio cues are never given a fallback image.
 * - Params, frames and shapes go through the field policies; version is fixed to "2.0".
 *
 * Never fails. The result is a fixed point: sanitizing it again yields an equal document.
 */
Document sanitizeDocument(const Document& doc, std::vector<RepairWarning>* warnings = nullptr);

} // namespace svga

#endif // SVGA_SANITIZE_KEY_REGISTRY_H
