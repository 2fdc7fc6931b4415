#ifndef SVGA_CODEC_CODEC_CONTEXT_H
#define SVGA_CODEC_CODEC_CONTEXT_H

#include "svga/core/types.h"

#include <string>
#include <string_view>
#include <unordered_map>

namespace google::protobuf {
class Descriptor;
class DescriptorPool;
} // namespace google::protobuf

namespace svga {

// Schema registry for the SVGA 2.0 wire format.
//
// Binds every message the codec touches by name and checks each field number (and the
// unpacked dash encoding) against the published 2.0 table. A context that fails the
// check, or that finds no usable zlib runtime, is not ready; decoder and encoder refuse
// to run against it with DependencyUnavailable.
//
// Construct one at startup and pass it by reference. The default constructor binds the
// compiled-in schema; that binding is computed once per process and shared.
class CodecContext {
public:
    CodecContext();

    // Binds against an arbitrary pool (tests use this to feed in non-conforming schemas).
    explicit CodecContext(const google::protobuf::DescriptorPool* pool);

    bool ready() const noexcept { return status_ == SvgaError::Ok; }
    SvgaError status() const noexcept { return status_; }
    const std::string& failureReason() const noexcept { return failureReason_; }

    // Lookup by name relative to the package, e.g. "MovieEntity" or "ShapeEntity.ShapeStyle".
    const google::protobuf::Descriptor* descriptor(std::string_view messageName) const;

    std::size_t messageCount() const noexcept { return descriptors_.size(); }

private:
    void bind(const google::protobuf::DescriptorPool* pool);

    SvgaError status_{SvgaError::DependencyUnavailable};
    std::string failureReason_;
    std::unordered_map<std::string, const google::protobuf::Descriptor*> descriptors_;
};

} // namespace svga

#endif // SVGA_CODEC_CODEC_CONTEXT_H
