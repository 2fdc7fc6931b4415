#pragma once

#include "svga/model/document.h"

#include "svga.pb.h"

namespace svga::codec::detail {

namespace pb = ::com::opensource::svga;

// Wire message -> model. Absent sub-messages become their model defaults
// (identity transform, zero layout); present ones are copied field by field.
void messageToDocument(const pb::MovieEntity& msg, Document& out);

// Model -> wire message. Expects an already sanitized document whose images are raw bytes.
void documentToMessage(const Document& doc, pb::MovieEntity& out);

} // namespace svga::codec::detail
