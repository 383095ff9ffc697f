#include "face_mesh.hpp"
#include <fstream>
#include <iomanip>

namespace voxgrid {

namespace {

struct FaceDir {
    int offset[3];
    int corners[4][3];  // 0 = cell min corner, 1 = max corner, per axis
};

// Corner order gives counter-clockwise winding seen from outside
const FaceDir kFaceDirs[6] = {
    {{ 1, 0, 0}, {{1, 0, 0}, {1, 1, 0}, {1, 1, 1}, {1, 0, 1}}},
    {{-1, 0, 0}, {{0, 0, 1}, {0, 1, 1}, {0, 1, 0}, {0, 0, 0}}},
    {{ 0, 1, 0}, {{0, 1, 0}, {0, 1, 1}, {1, 1, 1}, {1, 1, 0}}},
    {{ 0,-1, 0}, {{0, 0, 0}, {1, 0, 0}, {1, 0, 1}, {0, 0, 1}}},
    {{ 0, 0, 1}, {{0, 0, 1}, {1, 0, 1}, {1, 1, 1}, {0, 1, 1}}},
    {{ 0, 0,-1}, {{0, 0, 0}, {0, 1, 0}, {1, 1, 0}, {1, 0, 0}}},
};

constexpr int kPosZ = 4;

void add_quad(QuadMesh& mesh, const Vec3d& lo, double size, const FaceDir& dir) {
    const auto base = static_cast<uint32_t>(mesh.vertices.size());
    for (const auto& c : dir.corners) {
        mesh.vertices.emplace_back(lo.x + c[0] * size, lo.y + c[1] * size, lo.z + c[2] * size);
    }
    mesh.triangles.push_back({{base, base + 1, base + 2}});
    mesh.triangles.push_back({{base, base + 2, base + 3}});
}

} // namespace

std::vector<QuadMesh> FaceMesher::extract(const VoxelGrid& grid, GridLayer layer,
                                          double threshold) {
    grid.require_layer(layer);

    const GridSpec& spec = grid.spec();
    const auto& dims = spec.dims;

    std::vector<uint8_t> occupied(grid.size(), 0);
    for (size_t i = 0; i < grid.size(); ++i) {
        if (layer == GridLayer::Category && grid.categories()[i] == kEmptyCategory) {
            continue;
        }
        occupied[i] = static_cast<double>(grid.value(layer, i)) > threshold ? 1 : 0;
    }

    std::vector<QuadMesh> meshes;
    if (layer == GridLayer::Counts) {
        meshes.resize(1);
        meshes[0].name = "occupied";
    } else {
        meshes.resize(kCategoryCount);
        for (size_t c = 0; c < kCategoryCount; ++c) {
            meshes[c].name = category_name(static_cast<Category>(c));
        }
    }

    for (size_t i = 0; i < dims[0]; ++i) {
        for (size_t j = 0; j < dims[1]; ++j) {
            for (size_t k = 0; k < dims[2]; ++k) {
                const size_t cell = spec.linear_index(i, j, k);
                if (!occupied[cell]) continue;

                size_t group = 0;
                bool terrain = false;
                if (layer == GridLayer::Category) {
                    group = grid.categories()[cell];
                    terrain = group == static_cast<size_t>(Category::Terrain);
                }

                const Vec3d lo = spec.cell_min_corner(i, j, k);
                const long long idx[3] = {static_cast<long long>(i),
                                          static_cast<long long>(j),
                                          static_cast<long long>(k)};

                for (int d = 0; d < 6; ++d) {
                    if (terrain && d != kPosZ) continue;

                    const FaceDir& dir = kFaceDirs[d];
                    bool exposed = false;
                    long long n[3];
                    for (int a = 0; a < 3; ++a) {
                        n[a] = idx[a] + dir.offset[a];
                        if (n[a] < 0 || n[a] >= static_cast<long long>(dims[a])) {
                            exposed = true;
                        }
                    }
                    if (!exposed) {
                        exposed = !occupied[spec.linear_index(static_cast<size_t>(n[0]),
                                                              static_cast<size_t>(n[1]),
                                                              static_cast<size_t>(n[2]))];
                    }
                    if (exposed) {
                        add_quad(meshes[group], lo, spec.voxel_size, dir);
                    }
                }
            }
        }
    }

    return meshes;
}

bool FaceMesher::write_obj(const std::string& path, const std::vector<QuadMesh>& meshes) {
    std::ofstream file(path);
    if (!file) {
        return false;
    }

    file << std::setprecision(10);
    file << "# voxgrid exposed-face mesh\n";

    size_t vertex_offset = 1;  // OBJ indices are 1-based
    for (const auto& mesh : meshes) {
        if (mesh.empty()) continue;

        file << "g " << mesh.name << "\n";
        for (const auto& v : mesh.vertices) {
            file << "v " << v.x << " " << v.y << " " << v.z << "\n";
        }
        for (const auto& t : mesh.triangles) {
            file << "f " << (t[0] + vertex_offset) << " "
                 << (t[1] + vertex_offset) << " "
                 << (t[2] + vertex_offset) << "\n";
        }
        vertex_offset += mesh.vertices.size();
    }

    return static_cast<bool>(file);
}

} // namespace voxgrid
