#pragma once

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <BRepAdaptor_Surface.hxx>
#include <BRepBndLib.hxx>
#include <BRepGProp.hxx>
#include <Bnd_Box.hxx>
#include <GProp_GProps.hxx>
#include <GeomAbs_SurfaceType.hxx>
#include <TopAbs_ShapeEnum.hxx>
#include <TopExp.hxx>
#include <TopoDS.hxx>
#include <TopoDS_Face.hxx>
#include <TopoDS_Shape.hxx>
#include <TopTools_IndexedMapOfShape.hxx>
#include <gp_Pln.hxx>
#include <gp_Pnt.hxx>

namespace boxjoint::kernel::elementmap {

enum class ElementKind {
    Body,
    Face,
    Unknown
};

struct ElementId {
    std::string value;

    std::string toString() const { return value; }
    static ElementId From(const std::string& v) { return ElementId{v}; }
};

struct ElementDescriptor {
    TopAbs_ShapeEnum shapeType{TopAbs_SHAPE};
    gp_Pnt center{0.0, 0.0, 0.0};
    double size{0.0};      // Diagonal length of the bounding box
    double magnitude{0.0}; // Area or volume
};

struct Entry {
    ElementId id;
    ElementKind kind{ElementKind::Unknown};
    TopoDS_Shape shape;
    ElementDescriptor descriptor;
    std::string bodyId;
};

/**
 * @brief Stable names for bodies and their faces.
 *
 * Faces are named "<bodyId>/face/<index>" in TopExp map order when a body is
 * registered. A name keeps resolving after the body is rebuilt as long as a
 * planar face on the same carrier plane is left; the closest descriptor wins.
 */
class ElementMap {
public:
    void registerElement(const ElementId& id, ElementKind kind, const TopoDS_Shape& shape,
                         const std::string& bodyId = {});

    /**
     * @brief Registers a body and names all of its faces.
     * @return Face IDs in index order.
     */
    std::vector<ElementId> registerBody(const std::string& bodyId, const TopoDS_Shape& shape);
    void removeBody(const std::string& bodyId);

    /**
     * @brief Points existing names of @p bodyId at the faces of a rebuilt shape.
     *
     * Names without a match keep their old shape and fail to resolve later.
     * @return Number of face names that were rebound.
     */
    int rebindBody(const std::string& bodyId, const TopoDS_Shape& shape);
    void clear() { entries_.clear(); }

    const Entry* find(const ElementId& id) const;
    bool contains(const ElementId& id) const;
    std::vector<ElementId> ids() const;
    std::vector<ElementId> faceIds(const std::string& bodyId) const;

    /**
     * @brief Finds the face named @p id inside @p currentBody.
     *
     * Same shape first, then the best matching coplanar face.
     */
    std::optional<TopoDS_Face> resolveFace(const ElementId& id, const TopoDS_Shape& currentBody) const;

    static ElementId makeFaceId(const std::string& bodyId, int index);

private:
    ElementDescriptor computeDescriptor(const TopoDS_Shape& shape) const;
    double score(const ElementDescriptor& target, const ElementDescriptor& candidate) const;

    std::unordered_map<std::string, Entry> entries_;
};

// --- Inline implementation -------------------------------------------------

inline void ElementMap::registerElement(const ElementId& id, ElementKind kind, const TopoDS_Shape& shape,
                                        const std::string& bodyId) {
    Entry entry{ id, kind, shape, computeDescriptor(shape), bodyId };
    entries_[id.value] = entry;
}

inline ElementId ElementMap::makeFaceId(const std::string& bodyId, int index) {
    return ElementId{bodyId + "/face/" + std::to_string(index)};
}

inline std::vector<ElementId> ElementMap::registerBody(const std::string& bodyId, const TopoDS_Shape& shape) {
    removeBody(bodyId);
    registerElement(ElementId{bodyId}, ElementKind::Body, shape, bodyId);

    std::vector<ElementId> faces;
    if (shape.IsNull()) return faces;

    TopTools_IndexedMapOfShape faceMap;
    TopExp::MapShapes(shape, TopAbs_FACE, faceMap);
    faces.reserve(static_cast<std::size_t>(faceMap.Extent()));
    for (int i = 1; i <= faceMap.Extent(); ++i) {
        ElementId faceId = makeFaceId(bodyId, i - 1);
        registerElement(faceId, ElementKind::Face, faceMap(i), bodyId);
        faces.push_back(std::move(faceId));
    }
    return faces;
}

inline void ElementMap::removeBody(const std::string& bodyId) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.bodyId == bodyId) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

inline int ElementMap::rebindBody(const std::string& bodyId, const TopoDS_Shape& shape) {
    if (!contains(ElementId{bodyId})) {
        return static_cast<int>(registerBody(bodyId, shape).size());
    }

    int rebound = 0;
    std::vector<std::pair<std::string, TopoDS_Face>> updates;
    for (auto const& [key, entry] : entries_) {
        if (entry.bodyId != bodyId || entry.kind != ElementKind::Face) continue;
        if (auto face = resolveFace(entry.id, shape)) {
            updates.emplace_back(key, *face);
        }
    }
    for (auto const& [key, face] : updates) {
        Entry& entry = entries_[key];
        entry.shape = face;
        entry.descriptor = computeDescriptor(face);
        ++rebound;
    }

    Entry& body = entries_[bodyId];
    body.shape = shape;
    body.descriptor = computeDescriptor(shape);
    return rebound;
}

inline const Entry* ElementMap::find(const ElementId& id) const {
    auto it = entries_.find(id.value);
    if (it == entries_.end()) return nullptr;
    return &it->second;
}

inline bool ElementMap::contains(const ElementId& id) const {
    return entries_.find(id.value) != entries_.end();
}

inline std::vector<ElementId> ElementMap::ids() const {
    std::vector<ElementId> out;
    out.reserve(entries_.size());
    for (auto const& [key, entry] : entries_) {
        out.push_back(entry.id);
    }
    return out;
}

inline std::vector<ElementId> ElementMap::faceIds(const std::string& bodyId) const {
    std::vector<std::pair<int, ElementId>> indexed;
    const std::string prefix = bodyId + "/face/";
    for (auto const& [key, entry] : entries_) {
        if (entry.kind == ElementKind::Face && entry.bodyId == bodyId &&
            key.compare(0, prefix.size(), prefix) == 0) {
            indexed.emplace_back(std::stoi(key.substr(prefix.size())), entry.id);
        }
    }
    std::sort(indexed.begin(), indexed.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<ElementId> out;
    out.reserve(indexed.size());
    for (auto& [index, id] : indexed) {
        out.push_back(std::move(id));
    }
    return out;
}

inline std::optional<TopoDS_Face> ElementMap::resolveFace(const ElementId& id,
                                                          const TopoDS_Shape& currentBody) const {
    const Entry* entry = find(id);
    if (!entry || entry->kind != ElementKind::Face || currentBody.IsNull()) return std::nullopt;

    TopTools_IndexedMapOfShape faceMap;
    TopExp::MapShapes(currentBody, TopAbs_FACE, faceMap);
    for (int i = 1; i <= faceMap.Extent(); ++i) {
        if (faceMap(i).IsSame(entry->shape)) {
            return TopoDS::Face(faceMap(i));
        }
    }

    // Rebuilt body: look for a planar face on the registered carrier plane.
    BRepAdaptor_Surface registered(TopoDS::Face(entry->shape), true);
    if (registered.GetType() != GeomAbs_Plane) return std::nullopt;
    const gp_Pln plane = registered.Plane();
    constexpr double kPlaneTolerance = 1e-6;

    std::optional<TopoDS_Face> best;
    double bestScore = std::numeric_limits<double>::max();
    for (int i = 1; i <= faceMap.Extent(); ++i) {
        const TopoDS_Face candidate = TopoDS::Face(faceMap(i));
        BRepAdaptor_Surface surface(candidate, true);
        if (surface.GetType() != GeomAbs_Plane) continue;

        const gp_Pln candidatePlane = surface.Plane();
        const bool sameOrientation = candidate.Orientation() == entry->shape.Orientation();
        const bool parallel = candidatePlane.Axis().Direction().IsParallel(plane.Axis().Direction(), 1e-6);
        if (!parallel || plane.Distance(candidatePlane.Location()) > kPlaneTolerance) continue;

        // Outward normal must match the registered face.
        const bool sameNormal = candidatePlane.Axis().Direction().IsEqual(plane.Axis().Direction(), 1e-6);
        if (sameNormal != sameOrientation) continue;

        const double s = score(entry->descriptor, computeDescriptor(candidate));
        if (s < bestScore) {
            bestScore = s;
            best = candidate;
        }
    }
    return best;
}

inline ElementDescriptor ElementMap::computeDescriptor(const TopoDS_Shape& shape) const {
    ElementDescriptor desc;
    if (shape.IsNull()) return desc;

    desc.shapeType = shape.ShapeType();

    Bnd_Box box;
    BRepBndLib::Add(shape, box);
    if (!box.IsVoid()) {
        Standard_Real xmin, ymin, zmin, xmax, ymax, zmax;
        box.Get(xmin, ymin, zmin, xmax, ymax, zmax);
        desc.center = gp_Pnt((xmin + xmax) * 0.5, (ymin + ymax) * 0.5, (zmin + zmax) * 0.5);
        const double dx = xmax - xmin;
        const double dy = ymax - ymin;
        const double dz = zmax - zmin;
        desc.size = std::sqrt(dx * dx + dy * dy + dz * dz);
    }

    GProp_GProps props;
    switch (desc.shapeType) {
    case TopAbs_FACE:
        BRepGProp::SurfaceProperties(shape, props);
        desc.magnitude = props.Mass();
        break;
    case TopAbs_SOLID:
    case TopAbs_COMPOUND:
    case TopAbs_COMPSOLID:
        BRepGProp::VolumeProperties(shape, props);
        desc.magnitude = props.Mass();
        break;
    default:
        desc.magnitude = 0.0;
        break;
    }

    return desc;
}

inline double ElementMap::score(const ElementDescriptor& target, const ElementDescriptor& candidate) const {
    const double centerDistance = target.center.Distance(candidate.center);
    const double sizeDiff = std::abs(target.size - candidate.size);
    const double magDiff = std::abs(target.magnitude - candidate.magnitude);
    return centerDistance + 0.1 * sizeDiff + 0.01 * magDiff;
}

} // namespace boxjoint::kernel::elementmap
