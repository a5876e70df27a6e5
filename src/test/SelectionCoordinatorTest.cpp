#include <cassert>
#include <chrono>
#include <iostream>

#include "application/AssetTracker.hpp"
#include "application/AssociationManager.hpp"
#include "application/SelectionCoordinator.hpp"
#include "domain/EngineErrors.hpp"

using namespace assetbridge;
using domain::AssetKind;
using domain::ProgressionStage;

int main() {
    std::cout << "[Test] Starting SelectionCoordinator Test..." << std::endl;

    application::AssetTracker tracker;
    application::AssociationManager associations(tracker, std::chrono::seconds(1800));
    application::SelectionCoordinator selection(tracker, associations);
    associations.bindSelection(&selection);

    int notifications = 0;
    std::vector<domain::UnifiedObject> lastView;
    selection.setChangeListener([&](const std::vector<domain::UnifiedObject>& view) {
        ++notifications;
        lastView = view;
    });

    const auto now = std::chrono::system_clock::now();
    const std::string image = "/out/images/a.png";
    const std::string model = "/out/3d_models/a.glb";
    const std::string textured = "/out/3d_models/textured/a_textured.glb";
    const std::string loose = "/out/3d_models/loose.glb";
    tracker.add(image, AssetKind::Image, now);

    // 1. Unknown paths are rejected
    bool notFound = false;
    try {
        selection.toggle("/out/images/unknown.png");
    } catch (const domain::NotFoundError&) {
        notFound = true;
    }
    assert(notFound);
    assert(notifications == 0);

    // 2. Selecting an image without a model
    assert(selection.toggle(image));
    assert(selection.isSelected(image));
    assert(notifications == 1);
    assert(lastView.size() == 1);
    assert(lastView[0].stage == ProgressionStage::ImageOnly);
    assert(lastView[0].key == image);

    selection.setSelected(image, true); // unchanged value: no notification
    assert(notifications == 1);
    std::cout << "[PASS] Image selection." << std::endl;

    // 3. Linking a model to a selected image pulls it into the selection
    tracker.add(model, AssetKind::Model, now);
    associations.link(image, model);
    selection.onLinked(image, model);
    assert(selection.isSelected(model));
    assert(selection.recompute());
    assert(lastView.size() == 1); // one object per lineage
    assert(lastView[0].stage == ProgressionStage::HasModel);
    assert(lastView[0].key == model);
    assert(lastView[0].imagePath == image);
    assert(!selection.recompute()); // nothing changed, nothing published
    std::cout << "[PASS] Lineage dedup and auto-select." << std::endl;

    // 4. Textured state
    tracker.add(textured, AssetKind::TexturedModel, now);
    associations.markTextured(model, textured);
    selection.recompute();
    assert(lastView.size() == 1);
    assert(lastView[0].stage == ProgressionStage::Textured);
    assert(lastView[0].key == textured);
    assert(selection.isSelected(image));

    // Toggling selection never reverses the stage.
    selection.setSelected(image, false);
    assert(lastView.size() == 1);
    assert(lastView[0].stage == ProgressionStage::Textured);
    assert(lastView[0].imagePath == image);
    selection.setSelected(image, true);
    std::cout << "[PASS] Textured stage is stable under toggles." << std::endl;

    // 5. Standalone model and selection through the association manager
    tracker.add(loose, AssetKind::Model, now);
    associations.setSelected(loose, true);
    assert(selection.isSelected(loose));
    assert(lastView.size() == 2);
    assert(lastView[1].key == loose);
    assert(lastView[1].stage == ProgressionStage::HasModel);
    assert(lastView[1].imagePath.empty());

    auto models = selection.selectedPaths(AssetKind::Model);
    assert(models.size() == 2 && models[0] == model && models[1] == loose);

    selection.clearSelection(AssetKind::Model);
    assert(!selection.isSelected(loose));
    assert(selection.isSelected(image));
    std::cout << "[PASS] Standalone models and clearSelection." << std::endl;

    // 6. cleanupMissing leaves selection flags alone
    tracker.remove(model);
    assert(associations.cleanupMissing() == 1);
    assert(selection.isSelected(image));
    selection.recompute();
    assert(lastView.size() == 1);
    assert(lastView[0].stage == ProgressionStage::ImageOnly);

    selection.onAssetRemoved(model);
    auto flags = selection.flags();
    assert(flags.count(model) == 0);
    assert(flags.at(image));

    // 7. Restore replaces the flags without notifying
    int before = notifications;
    selection.restore({{loose, true}});
    assert(notifications == before);
    assert(!selection.isSelected(image));
    assert(selection.unifiedView().size() == 1);
    assert(selection.unifiedView()[0].key == loose);
    std::cout << "[PASS] Cleanup and restore." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
