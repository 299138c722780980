#pragma once

#include <optional>

#include <lsp/basic.hpp>

#include "lspshim/backend/backend_request.hpp"
#include "lspshim/core/shim_settings.hpp"
#include "lspshim/document/text_document.hpp"

namespace lspshim::backend {

// Build the backend call for one capability request
//
// Command line layout:
//   <executable> <args...> [--include-path <dir>]... <flag> [<cursor>] [<path>]
//
// The cursor is `line:column` in the backend convention, or a byte offset in
// offset mode. The document path is appended for file URIs so the backend
// can resolve relative imports; the text itself always arrives on stdin.
auto BuildBackendRequest(
    CapabilityKind kind, SnapshotPtr snapshot,
    std::optional<lsp::Position> cursor, const ShimSettings& settings)
    -> BackendRequest;

}  // namespace lspshim::backend
