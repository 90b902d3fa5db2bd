#pragma once

#include "scene/SceneObject.hpp"

#include <optional>
#include <string>
#include <vector>

namespace FreeFly {

/**
 * @brief Ordered list of scene objects
 *
 * Iteration order is insertion order and is the tie-break order for
 * picking. Object ids are handed out by the scene and stay valid until the
 * object is removed; pointers returned by Find() are invalidated by Add,
 * Duplicate, Remove and Clear.
 */
class Scene {
public:
    Scene() = default;

    // Non-copyable but movable
    Scene(const Scene&) = delete;
    Scene& operator=(const Scene&) = delete;
    Scene(Scene&&) noexcept = default;
    Scene& operator=(Scene&&) noexcept = default;

    /**
     * @brief Take ownership of an object and assign it a fresh id
     */
    ObjectId Add(SceneObject object);

    /**
     * @brief Deep copy an object, offset by +1 on X
     *
     * The copy shares the original's texture handle.
     */
    std::optional<ObjectId> Duplicate(ObjectId id);

    bool Remove(ObjectId id);
    void Clear();

    [[nodiscard]] SceneObject* Find(ObjectId id);
    [[nodiscard]] const SceneObject* Find(ObjectId id) const;
    [[nodiscard]] std::optional<size_t> IndexOf(ObjectId id) const;

    [[nodiscard]] std::vector<SceneObject>& GetObjects() { return m_objects; }
    [[nodiscard]] const std::vector<SceneObject>& GetObjects() const { return m_objects; }
    [[nodiscard]] size_t GetObjectCount() const noexcept { return m_objects.size(); }
    [[nodiscard]] bool IsEmpty() const noexcept { return m_objects.empty(); }

    [[nodiscard]] const std::string& GetName() const { return m_name; }
    void SetName(const std::string& name) { m_name = name; }

private:
    std::vector<SceneObject> m_objects;
    std::string m_name = "Untitled";
    ObjectId m_nextId = 1;
};

} // namespace FreeFly
