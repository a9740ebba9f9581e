#pragma once

/// @file scene_manager.hpp
/// @brief Global beat counter, active scene stack, and beat-scheduled events.

#include "anim/scene.hpp"
#include "core/types.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace cadence::anim
{
    class SceneManager;

    using EventAction = std::function<void(SceneManager&)>;

    /// @brief An action fired when the global beat reaches `beat`.
    struct Event
    {
        i64 beat = 0;
        EventAction action;

        /// @brief Replace the primary scene.
        [[nodiscard]] static EventAction swap_scene(std::string name, i64 at = 0);

        /// @brief Start a scene on top of the active ones.
        [[nodiscard]] static EventAction layer_scene(std::string name, i64 at = 0);

        [[nodiscard]] static EventAction remove_scene(std::string name);
    };

    /// @brief Owns every scene and decides which ones draw on each beat.
    ///
    /// Index 0 of the active list is the primary scene; later entries are layered
    /// on top and draw after it. Unknown scene names are logged and ignored.
    class SceneManager
    {
    public:
        SceneManager(std::vector<Scene> scenes, std::vector<Event> events);

        SceneManager(const SceneManager&) = delete;
        SceneManager& operator=(const SceneManager&) = delete;
        SceneManager(SceneManager&&) = default;
        SceneManager& operator=(SceneManager&&) = default;

        void start_scene(const std::string& name, i64 at = 0);
        void add_scene(const std::string& name, i64 at = 0);
        void remove_scene(const std::string& name);

        /// @brief Let every active scene draw, then advance the global beat.
        void request_next(bool render = true);

        /// @brief Advance the global beat and fire its events.
        void next_beat();

        /// @brief -1 before the first request_next().
        [[nodiscard]] i64 current_beat() const { return m_current_beat; }

        [[nodiscard]] bool has_scene(const std::string& name) const;

        /// @brief Names of the active scenes, primary first.
        [[nodiscard]] std::vector<std::string> active_scenes() const;

    private:
        [[nodiscard]] Scene* find(const std::string& name);

        std::map<std::string, Scene> m_scenes;
        std::map<i64, std::vector<EventAction>> m_events;
        std::vector<Scene*> m_active;
        i64 m_current_beat = -1;
    };

} // namespace cadence::anim
