/// @file scene_manager.cpp
/// @brief SceneManager implementation.

#include "anim/scene_manager.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <utility>

namespace cadence::anim
{

// =================================================================
// Event factories
// =================================================================

EventAction Event::swap_scene(std::string name, i64 at)
{
    return [name = std::move(name), at](SceneManager& manager) { manager.start_scene(name, at); };
}

EventAction Event::layer_scene(std::string name, i64 at)
{
    return [name = std::move(name), at](SceneManager& manager) { manager.add_scene(name, at); };
}

EventAction Event::remove_scene(std::string name)
{
    return [name = std::move(name)](SceneManager& manager) { manager.remove_scene(name); };
}

// =================================================================
// SceneManager
// =================================================================

SceneManager::SceneManager(std::vector<Scene> scenes, std::vector<Event> events)
{
    for (auto& scene : scenes)
    {
        std::string name = scene.name();
        const bool inserted = m_scenes.emplace(name, std::move(scene)).second;
        if (!inserted)
        {
            CDN_WARN("SceneManager: duplicate scene '{}' ignored", name);
        }
    }

    for (auto& event : events)
    {
        if (event.action)
        {
            m_events[event.beat].push_back(std::move(event.action));
        }
    }

    CDN_INFO("SceneManager: {} scenes, {} event beats", m_scenes.size(), m_events.size());
}

Scene* SceneManager::find(const std::string& name)
{
    auto it = m_scenes.find(name);
    if (it == m_scenes.end())
    {
        CDN_WARN("SceneManager: unknown scene '{}'", name);
        return nullptr;
    }
    return &it->second;
}

bool SceneManager::has_scene(const std::string& name) const
{
    return m_scenes.find(name) != m_scenes.end();
}

std::vector<std::string> SceneManager::active_scenes() const
{
    std::vector<std::string> names;
    names.reserve(m_active.size());
    for (const Scene* scene : m_active)
    {
        names.push_back(scene->name());
    }
    return names;
}

void SceneManager::start_scene(const std::string& name, i64 at)
{
    Scene* scene = find(name);
    if (scene == nullptr)
    {
        return;
    }

    if (m_active.empty())
    {
        m_active.push_back(scene);
    }
    else
    {
        m_active.front() = scene;
    }

    CDN_DEBUG("SceneManager: beat {} start scene '{}' at {}", m_current_beat, name, at);
    scene->start(at);
}

void SceneManager::add_scene(const std::string& name, i64 at)
{
    Scene* scene = find(name);
    if (scene == nullptr)
    {
        return;
    }

    m_active.push_back(scene);
    CDN_DEBUG("SceneManager: beat {} layer scene '{}' at {}", m_current_beat, name, at);
    scene->start(at);
}

void SceneManager::remove_scene(const std::string& name)
{
    auto it = std::find_if(m_active.begin(), m_active.end(),
                           [&name](const Scene* scene) { return scene->name() == name; });
    if (it == m_active.end())
    {
        return;
    }

    m_active.erase(it);
    CDN_DEBUG("SceneManager: beat {} remove scene '{}'", m_current_beat, name);
}

void SceneManager::request_next(bool render)
{
    // Iterate a copy: a hook may start or remove scenes
    const std::vector<Scene*> active = m_active;
    for (Scene* scene : active)
    {
        scene->request_frame(render);
    }

    next_beat();
}

void SceneManager::next_beat()
{
    ++m_current_beat;

    auto it = m_events.find(m_current_beat);
    if (it == m_events.end())
    {
        return;
    }

    for (const auto& action : it->second)
    {
        action(*this);
    }
}

} // namespace cadence::anim
