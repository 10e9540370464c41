#include "unbox/target_manifest.hpp"

namespace unbox {

namespace {

void add_spec(TargetManifest& manifest, const FileSpec& spec) {
    manifest.paths.insert(spec.path);
    if (spec.isMove()) {
        manifest.moves.push_back(spec.asMove());
    }
}

} // namespace

TargetManifest build_target_manifest(const std::vector<FileSpec>& leaf,
                                     const std::vector<FileSpec>& common) {
    TargetManifest manifest;
    for (const auto& spec : leaf) {
        add_spec(manifest, spec);
    }
    for (const auto& spec : common) {
        add_spec(manifest, spec);
    }
    return manifest;
}

} // namespace unbox
