#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>

#include "application/AssetTracker.hpp"
#include "application/AssociationManager.hpp"
#include "domain/EngineErrors.hpp"

using namespace assetbridge;
using application::AssociationManager;
using domain::AssetKind;
using std::chrono::seconds;

namespace {

void TestNameFragments() {
    assert(AssociationManager::NameFragment("/out/images/robot_001.png") == "robot");
    assert(AssociationManager::NameFragment("/out/3d_models/hy3d_robot_00001_.glb") == "robot");
    assert(AssociationManager::NameFragment("/out/3d_models/textured/Robot_textured.glb") == "robot");
    assert(AssociationManager::NameFragment("/out/images/ComfyUI_castle-12.PNG") == "castle");
    assert(AssociationManager::NameFragment("/out/images/ComfyUI_00012_.png").empty());

    assert(AssociationManager::FragmentsMatch("robot", "robot"));
    assert(AssociationManager::FragmentsMatch("robot", "robotarm"));
    assert(!AssociationManager::FragmentsMatch("cat", "cats")); // too short for containment
    assert(!AssociationManager::FragmentsMatch("", ""));
    assert(!AssociationManager::FragmentsMatch("robot", "castle"));
    std::cout << "[PASS] Name fragments." << std::endl;
}

void TestManualLinking() {
    application::AssetTracker tracker;
    AssociationManager associations(tracker, seconds(1800));
    int mutations = 0;
    associations.setMutationHook([&] { ++mutations; });

    const auto now = std::chrono::system_clock::now();
    tracker.add("/out/images/a.png", AssetKind::Image, now);
    tracker.add("/out/images/b.png", AssetKind::Image, now);
    tracker.add("/out/3d_models/x.glb", AssetKind::Model, now);
    tracker.add("/out/3d_models/y.glb", AssetKind::Model, now);

    associations.link("/out/images/a.png", "/out/3d_models/x.glb");
    assert(associations.getModelForImage("/out/images/a.png") == std::string("/out/3d_models/x.glb"));
    assert(associations.getImageForModel("/out/3d_models/x.glb") == std::string("/out/images/a.png"));
    assert(mutations == 1);

    // Overwrite keeps the reverse map consistent.
    associations.link("/out/images/a.png", "/out/3d_models/y.glb");
    assert(!associations.getImageForModel("/out/3d_models/x.glb").has_value());

    // Taking a model from another image detaches it from the first.
    associations.link("/out/images/b.png", "/out/3d_models/y.glb");
    assert(!associations.getModelForImage("/out/images/a.png").has_value());
    assert(associations.getImageForModel("/out/3d_models/y.glb") == std::string("/out/images/b.png"));
    assert(associations.associations().size() == 1);

    bool notFound = false;
    try {
        associations.link("/out/images/missing.png", "/out/3d_models/x.glb");
    } catch (const domain::NotFoundError& e) {
        notFound = e.path() == "/out/images/missing.png";
    }
    assert(notFound);

    bool wrongKind = false;
    try {
        associations.link("/out/3d_models/x.glb", "/out/images/a.png");
    } catch (const std::invalid_argument&) {
        wrongKind = true;
    }
    assert(wrongKind);

    assert(associations.unlink("/out/images/b.png"));
    assert(!associations.unlink("/out/images/b.png"));
    assert(associations.associations().empty());

    bool unbound = false;
    try {
        associations.setSelected("/out/images/a.png", true);
    } catch (const std::logic_error&) {
        unbound = true;
    }
    assert(unbound);
    std::cout << "[PASS] Manual link/unlink." << std::endl;
}

void TestAutoLink() {
    application::AssetTracker tracker;
    AssociationManager associations(tracker, seconds(1800));
    const auto t0 = std::chrono::system_clock::now();

    auto image = tracker.add("/out/images/robot_001.png", AssetKind::Image, t0).first;
    assert(!associations.autoLink(image).has_value()); // nothing to pair yet

    auto model = tracker.add("/out/3d_models/hy3d_robot_00001_.glb", AssetKind::Model, t0 + seconds(60)).first;
    auto linked = associations.autoLink(model);
    assert(linked.has_value());
    assert(linked->first == image.path && linked->second == model.path);

    // Model older than the image never correlates.
    auto oldModel = tracker.add("/out/3d_models/castle.glb", AssetKind::Model, t0 - seconds(10)).first;
    auto castle = tracker.add("/out/images/castle_01.png", AssetKind::Image, t0).first;
    assert(!associations.autoLink(castle).has_value());
    (void)oldModel;

    // Outside the correlation window.
    auto tower = tracker.add("/out/images/tower_1.png", AssetKind::Image, t0).first;
    auto lateTower = tracker.add("/out/3d_models/tower_1.glb", AssetKind::Model, t0 + seconds(3600)).first;
    assert(!associations.autoLink(lateTower).has_value());
    (void)tower;

    // Two candidate images: ambiguous, stays unlinked.
    tracker.add("/out/images/cat_001.png", AssetKind::Image, t0);
    tracker.add("/out/images/cat_002.png", AssetKind::Image, t0);
    auto cat = tracker.add("/out/3d_models/cat.glb", AssetKind::Model, t0 + seconds(5)).first;
    assert(!associations.autoLink(cat).has_value());
    assert(!associations.getImageForModel(cat.path).has_value());
    std::cout << "[PASS] Incremental auto-link." << std::endl;
}

void TestAutoDetectAndCleanup() {
    application::AssetTracker tracker;
    AssociationManager associations(tracker, seconds(1800));
    const auto t0 = std::chrono::system_clock::now();

    tracker.add("/out/images/ship_01.png", AssetKind::Image, t0);
    tracker.add("/out/images/tree_02.png", AssetKind::Image, t0);
    tracker.add("/out/images/elsewhere/ship.png", AssetKind::Image, t0);
    tracker.add("/out/3d_models/ship_01.glb", AssetKind::Model, t0 + seconds(30));
    tracker.add("/out/3d_models/tree_02.glb", AssetKind::Model, t0 + seconds(30));
    tracker.add("/other/3d_models/tree.glb", AssetKind::Model, t0 + seconds(30));

    auto created = associations.autoDetect("/out/images", "/out/3d_models");
    // The nested image is also under /out/images and matches "ship": ambiguous, so only tree links.
    assert(created.size() == 1);
    assert(created[0].first == "/out/images/tree_02.png");
    assert(created[0].second == "/out/3d_models/tree_02.glb");

    // A second pass finds nothing new.
    assert(associations.autoDetect("/out/images", "/out/3d_models").empty());

    associations.link("/out/images/ship_01.png", "/out/3d_models/ship_01.glb");
    associations.markTextured("/out/3d_models/ship_01.glb");
    assert(associations.isTextured("/out/3d_models/ship_01.glb"));

    // Nothing missing: cleanup is a no-op.
    assert(associations.cleanupMissing() == 0);
    assert(associations.associations().size() == 2);

    tracker.remove("/out/3d_models/ship_01.glb");
    assert(associations.cleanupMissing() == 1);
    assert(!associations.getModelForImage("/out/images/ship_01.png").has_value());
    assert(!associations.isTextured("/out/3d_models/ship_01.glb"));
    assert(associations.getModelForImage("/out/images/tree_02.png") == std::string("/out/3d_models/tree_02.glb"));
    std::cout << "[PASS] autoDetect and cleanupMissing." << std::endl;
}

void TestTextured() {
    application::AssetTracker tracker;
    AssociationManager associations(tracker, seconds(1800));
    const auto t0 = std::chrono::system_clock::now();

    bool notFound = false;
    try {
        associations.markTextured("/out/3d_models/none.glb");
    } catch (const domain::NotFoundError&) {
        notFound = true;
    }
    assert(notFound);

    tracker.add("/out/3d_models/robot.glb", AssetKind::Model, t0);
    auto textured = tracker.add("/out/3d_models/textured/robot_textured.glb", AssetKind::TexturedModel,
                                t0 + seconds(90)).first;
    auto marked = associations.autoMarkTextured(textured);
    assert(marked == std::string("/out/3d_models/robot.glb"));
    assert(associations.texturedPathFor("/out/3d_models/robot.glb") == textured.path);

    // An explicit mark without a path keeps the known variant.
    associations.markTextured("/out/3d_models/robot.glb");
    assert(associations.texturedPathFor("/out/3d_models/robot.glb") == textured.path);
    std::cout << "[PASS] Textured marking." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting AssociationManager Test..." << std::endl;
    TestNameFragments();
    TestManualLinking();
    TestAutoLink();
    TestAutoDetectAndCleanup();
    TestTextured();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
