#ifndef VOXGRID_FACE_MESH_HPP
#define VOXGRID_FACE_MESH_HPP

#include "types.hpp"
#include "voxel_grid.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace voxgrid {

// Quads of exposed voxel faces, two triangles per quad, outward winding
struct QuadMesh {
    std::string name;
    std::vector<Vec3d> vertices;
    std::vector<std::array<uint32_t, 3>> triangles;

    size_t face_count() const { return triangles.size() / 2; }
    bool empty() const { return triangles.empty(); }
};

class FaceMesher {
public:
    // A face is emitted when the neighbour across it lies outside the grid or
    // is unoccupied (value > threshold on the layer). Counts produce a single
    // "occupied" mesh; the category layer produces one mesh per category, in
    // id order, with terrain limited to its +z faces.
    static std::vector<QuadMesh> extract(const VoxelGrid& grid, GridLayer layer,
                                         double threshold = 0.0);

    // Wavefront OBJ, one group per non-empty mesh
    static bool write_obj(const std::string& path, const std::vector<QuadMesh>& meshes);
};

} // namespace voxgrid

#endif // VOXGRID_FACE_MESH_HPP
