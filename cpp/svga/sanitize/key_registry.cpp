#include "svga/sanitize/key_registry.h"
#include "svga/core/logging.h"
#include "svga/core/string_utils.h"
#include "svga/sanitize/field_policy.h"

#include <utility>

namespace svga {

namespace {

void addWarning(std::vector<RepairWarning>* warnings, RepairKind kind, const std::string& key, std::string detail) {
    SVGA_LOG_WARN("%s: %s (%s)", repairKindName(kind), key.c_str(), detail.c_str());
    if (warnings) warnings->push_back(RepairWarning{kind, key, std::move(detail)});
}

} // namespace

const std::string& KeyRegistry::registerKey(const std::string& original, std::vector<RepairWarning>* warnings) {
    auto it = mapping_.find(original);
    if (it != mapping_.end()) return it->second;

    const std::string base = sanitizeKey(original);
    std::string name = base;
    if (assigned_.count(name) != 0) {
        std::size_t n = 2;
        do {
            name = base + "_" + std::to_string(n++);
        } while (assigned_.count(name) != 0);
        addWarning(warnings, RepairKind::KeyCollision, original, "renamed to " + name);
    }
    assigned_.insert(name);
    return mapping_.emplace(original, std::move(name)).first->second;
}

std::string KeyRegistry::resolve(const std::string& reference) const {
    if (reference.empty()) return reference;
    auto it = mapping_.find(reference);
    if (it != mapping_.end()) return it->second;
    return sanitizeKey(reference);
}

namespace {

std::vector<std::uint8_t> assetBytes(const std::string& key, const ImageAsset& asset, std::vector<RepairWarning>* warnings) {
    std::vector<std::uint8_t> bytes;
    if (asset.encoding == ImageAsset::Encoding::Base64) {
        if (!base64Decode(asset.base64, bytes)) {
            addWarning(warnings, RepairKind::InvalidRasterData, key, "image data is not valid base64");
            return fallbackAssetBytes();
        }
    } else {
        bytes = asset.bytes;
    }
    if (bytes.empty()) {
        addWarning(warnings, RepairKind::InvalidRasterData, key, "image data is empty");
        return fallbackAssetBytes();
    }
    return bytes;
}

void ensureImage(
    const std::string& key,
    const char* role,
    std::map<std::string, ImageAsset>& images,
    std::vector<RepairWarning>* warnings) {
    if (key.empty() || images.count(key) != 0) return;
    images.emplace(key, ImageAsset::fromBytes(fallbackAssetBytes()));
    addWarning(warnings, RepairKind::InvalidReference, key, std::string("missing image for ") + role);
}

} // namespace

Document sanitizeDocument(const Document& doc, std::vector<RepairWarning>* warnings) {
    Document out;
    out.version = kSvgaWireVersion;
    out.params = sanitizeParams(doc.params);

    // Clean keys claim their own names before any renamed key can take them.
    KeyRegistry registry;
    for (const auto& kv : doc.images) {
        if (sanitizeKey(kv.first) == kv.first) registry.registerKey(kv.first, warnings);
    }
    for (const auto& kv : doc.images) {
        const std::string& name = registry.registerKey(kv.first, warnings);
        out.images.emplace(name, ImageAsset::fromBytes(assetBytes(kv.first, kv.second, warnings)));
    }

    out.sprites.reserve(doc.sprites.size());
    for (const Sprite& sprite : doc.sprites) {
        Sprite s;
        s.imageKey = registry.resolve(sprite.imageKey);
        s.matteKey = registry.resolve(sprite.matteKey);
        ensureImage(s.imageKey, "imageKey", out.images, warnings);
        ensureImage(s.matteKey, "matteKey", out.images, warnings);
        s.frames.reserve(sprite.frames.size());
        for (const Frame& frame : sprite.frames) s.frames.push_back(sanitizeFrame(frame));
        out.sprites.push_back(std::move(s));
    }

    out.audios.reserve(doc.audios.size());
    for (const AudioCue& audio : doc.audios) {
        AudioCue cue = audio;
        cue.audioKey = registry.resolve(audio.audioKey);
        out.audios.push_back(std::move(cue));
    }
    return out;
}

} // namespace svga
