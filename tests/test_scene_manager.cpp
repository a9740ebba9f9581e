/// @file test_scene_manager.cpp
/// @brief Unit tests for cadence::anim::SceneManager and scheduled events.

#include "test_main.hpp"

#include "anim/scene_manager.hpp"

#include <string>
#include <vector>

using namespace cadence;
using namespace cadence::anim;

// =================================================================
// Helpers
// =================================================================

/// Scene with one generator that logs "<name> <beat>" on every draw.
static Scene drawing_scene(const std::string& name, std::vector<std::string>& log)
{
    return Scene(name, {Generator{
                           .start_beat = 0,
                           .condition = {},
                           .on_create = {},
                           .request = [&log, name](i64 beat) { log.push_back(name + " " + std::to_string(beat)); },
                           .request_clear = {},
                       }});
}

static std::vector<Scene> two_scenes(std::vector<std::string>& log)
{
    std::vector<Scene> scenes;
    scenes.push_back(drawing_scene("a", log));
    scenes.push_back(drawing_scene("b", log));
    return scenes;
}

// =================================================================
// Scene control
// =================================================================

TEST_CASE("Global beat starts before zero and advances once per request")
{
    std::vector<std::string> log;
    SceneManager manager(two_scenes(log), {});

    CHECK(manager.current_beat() == -1);
    manager.request_next();
    CHECK(manager.current_beat() == 0);
    manager.request_next(false);
    CHECK(manager.current_beat() == 1);
}

TEST_CASE("start_scene replaces the primary scene")
{
    std::vector<std::string> log;
    SceneManager manager(two_scenes(log), {});

    manager.start_scene("a");
    manager.start_scene("b");

    CHECK(manager.active_scenes() == std::vector<std::string>{"b"});
    CHECK(log == std::vector<std::string>{"a 0", "b 0"});
}

TEST_CASE("Layered scenes draw after the primary one")
{
    std::vector<std::string> log;
    SceneManager manager(two_scenes(log), {});

    manager.start_scene("a");
    manager.add_scene("b");
    log.clear();

    manager.request_next();

    CHECK(manager.active_scenes() == std::vector<std::string>{"a", "b"});
    CHECK(log == std::vector<std::string>{"a 1", "b 1"});
}

TEST_CASE("Removed scenes stop drawing; unknown names are ignored")
{
    std::vector<std::string> log;
    SceneManager manager(two_scenes(log), {});

    manager.start_scene("a");
    manager.add_scene("b");
    manager.remove_scene("a");
    manager.remove_scene("missing");
    manager.add_scene("missing");
    log.clear();

    manager.request_next();

    CHECK(manager.has_scene("a"));
    CHECK_FALSE(manager.has_scene("missing"));
    CHECK(manager.active_scenes() == std::vector<std::string>{"b"});
    CHECK(log == std::vector<std::string>{"b 1"});
}

// =================================================================
// Events
// =================================================================

TEST_CASE("Events fire when the global beat reaches them")
{
    std::vector<std::string> log;
    std::vector<Event> events{
        Event{.beat = 0, .action = Event::swap_scene("a")},
        Event{.beat = 2, .action = Event::layer_scene("b")},
        Event{.beat = 3, .action = Event::remove_scene("a")},
    };
    SceneManager manager(two_scenes(log), std::move(events));

    manager.request_next();   // -> beat 0: start a
    CHECK(manager.active_scenes() == std::vector<std::string>{"a"});

    manager.request_next();   // -> beat 1
    manager.request_next();   // -> beat 2: layer b
    CHECK(manager.active_scenes() == std::vector<std::string>{"a", "b"});

    manager.request_next();   // -> beat 3: remove a
    CHECK(manager.active_scenes() == std::vector<std::string>{"b"});

    CHECK(log == std::vector<std::string>{"a 0", "a 1", "a 2", "b 0", "a 3", "b 1"});
}

TEST_CASE("Silent requests still fire events")
{
    std::vector<std::string> log;
    SceneManager manager(two_scenes(log), {Event{.beat = 1, .action = Event::swap_scene("b", 5)}});

    manager.request_next(false);
    manager.request_next(false);

    CHECK(manager.active_scenes() == std::vector<std::string>{"b"});
    CHECK(log == std::vector<std::string>{"b 5"});
}

TEST_CASE("Duplicate scene names keep the first scene")
{
    std::vector<std::string> log;
    std::vector<Scene> scenes;
    scenes.push_back(drawing_scene("a", log));
    scenes.push_back(Scene("a", {}));
    SceneManager manager(std::move(scenes), {});

    manager.start_scene("a");
    CHECK(log == std::vector<std::string>{"a 0"});
}
