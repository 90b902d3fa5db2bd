#include "scene/Scene.hpp"
#include "core/Logger.hpp"

#include <algorithm>

namespace FreeFly {

ObjectId Scene::Add(SceneObject object) {
    object.id = m_nextId++;
    if (object.name.empty()) {
        object.name = "Object_" + std::to_string(object.id);
    }
    m_objects.push_back(std::move(object));
    return m_objects.back().id;
}

std::optional<ObjectId> Scene::Duplicate(ObjectId id) {
    const SceneObject* original = Find(id);
    if (!original) {
        return std::nullopt;
    }

    SceneObject copy = *original;  // texture handle is a shared_ptr, so it stays shared
    copy.name += " Copy";
    copy.transform.position.x += 1.0f;

    const ObjectId newId = Add(std::move(copy));
    FREEFLY_LOG_INFO("Duplicated object {} as {}", id, newId);
    return newId;
}

bool Scene::Remove(ObjectId id) {
    auto it = std::find_if(m_objects.begin(), m_objects.end(),
                           [id](const SceneObject& o) { return o.id == id; });
    if (it == m_objects.end()) {
        return false;
    }
    FREEFLY_LOG_INFO("Deleted object {} ('{}')", id, it->name);
    m_objects.erase(it);
    return true;
}

void Scene::Clear() {
    m_objects.clear();
    m_name = "Untitled";
}

SceneObject* Scene::Find(ObjectId id) {
    auto it = std::find_if(m_objects.begin(), m_objects.end(),
                           [id](const SceneObject& o) { return o.id == id; });
    return it != m_objects.end() ? &*it : nullptr;
}

const SceneObject* Scene::Find(ObjectId id) const {
    auto it = std::find_if(m_objects.begin(), m_objects.end(),
                           [id](const SceneObject& o) { return o.id == id; });
    return it != m_objects.end() ? &*it : nullptr;
}

std::optional<size_t> Scene::IndexOf(ObjectId id) const {
    for (size_t i = 0; i < m_objects.size(); ++i) {
        if (m_objects[i].id == id) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace FreeFly
