#include "lspshim/backend/command_builder.hpp"

#include <fmt/format.h>

#include "lspshim/utils/uri.hpp"

namespace lspshim::backend {

auto BuildBackendRequest(
    CapabilityKind kind, SnapshotPtr snapshot,
    std::optional<lsp::Position> cursor, const ShimSettings& settings)
    -> BackendRequest {
  BackendRequest request{.kind = kind, .snapshot = snapshot};

  auto& argv = request.argv;
  argv.push_back(settings.backend.executable);
  argv.insert(
      argv.end(), settings.backend.args.begin(), settings.backend.args.end());
  for (const auto& dir : settings.backend.include_dirs) {
    argv.emplace_back("--include-path");
    argv.push_back(dir);
  }
  argv.push_back(settings.capabilities.For(kind).flag);

  if (cursor.has_value()) {
    PositionCodec codec(settings.position.convention, settings.position.mode);
    switch (settings.position.mode) {
      case PositionMode::kLineColumn: {
        auto position = codec.ToBackend(*snapshot, *cursor);
        request.position = position;
        argv.push_back(fmt::format("{}:{}", position.line, position.column));
        break;
      }
      case PositionMode::kOffset: {
        auto offset = codec.ToOffset(*snapshot, *cursor);
        request.offset = offset;
        argv.push_back(fmt::format("{}", offset));
        break;
      }
    }
  }

  if (utils::IsFileUri(snapshot->Uri())) {
    argv.push_back(utils::UriToPath(snapshot->Uri()));
  }

  return request;
}

}  // namespace lspshim::backend
