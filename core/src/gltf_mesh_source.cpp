// GLTF Mesh Source Implementation
// Uses cgltf for parsing GLTF/GLB files

#define CGLTF_IMPLEMENTATION
#include "cgltf.h"

#include <diorama/gltf_mesh_source.h>
#include <glm/gtc/type_ptr.hpp>
#include <glm/gtc/quaternion.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace diorama {

GltfMeshSource::GltfMeshSource(EventQueue& events) : m_events(events) {}

GltfMeshSource::~GltfMeshSource() {
    shutdown();
}

void GltfMeshSource::shutdown() {
    m_shutdown.store(true);

    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(m_threadsMutex);
        workers.swap(m_workers);
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) {
            w.thread.join();
        }
    }
}

size_t GltfMeshSource::reapFinished() {
    std::lock_guard<std::mutex> lock(m_threadsMutex);

    auto running = m_workers.begin();
    for (auto it = m_workers.begin(); it != m_workers.end(); ++it) {
        if (it->finished->load()) {
            if (it->thread.joinable()) it->thread.join();
        } else {
            if (running != it) *running = std::move(*it);
            ++running;
        }
    }
    m_workers.erase(running, m_workers.end());
    return m_workers.size();
}

void GltfMeshSource::load(const std::string& path, LoadCallbacks callbacks) {
    if (m_shutdown.load()) {
        std::cerr << "[GltfMeshSource] Ignoring load after shutdown: " << path << std::endl;
        return;
    }

    reapFinished();

    auto finished = std::make_shared<std::atomic<bool>>(false);
    try {
        std::lock_guard<std::mutex> lock(m_threadsMutex);
        std::thread thread([this, path, callbacks, finished]() {
            worker(path, callbacks);
            finished->store(true);
        });
        m_workers.push_back({std::move(thread), finished});
    } catch (const std::system_error& e) {
        std::cerr << "[GltfMeshSource] Failed to start loader thread: " << e.what() << std::endl;
        fail(callbacks, {LoadErrorKind::Io, path, std::string("Failed to start loader thread: ") + e.what()});
    }
}

void GltfMeshSource::fail(const LoadCallbacks& callbacks, LoadError error) {
    if (m_shutdown.load() || !callbacks.onError) return;

    auto onError = callbacks.onError;
    m_events.post([onError, error = std::move(error)]() {
        onError(error);
    });
}

void GltfMeshSource::worker(const std::string& path, const LoadCallbacks& callbacks) {
    // Nothing may escape a worker thread
    try {
        readAndParse(path, callbacks);
    } catch (const std::exception& e) {
        fail(callbacks, {LoadErrorKind::Io, path, std::string("Load aborted: ") + e.what()});
    }
}

void GltfMeshSource::readAndParse(const std::string& path, const LoadCallbacks& callbacks) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        fail(callbacks, {LoadErrorKind::NotFound, path, "File not found: " + path});
        return;
    }

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        fail(callbacks, {LoadErrorKind::Io, path, "Failed to open file: " + path});
        return;
    }

    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);
    if (size < 0) {
        fail(callbacks, {LoadErrorKind::Io, path, "Failed to determine file size: " + path});
        return;
    }

    const uint64_t total = static_cast<uint64_t>(size);
    std::vector<uint8_t> data(static_cast<size_t>(total));
    uint64_t loaded = 0;

    while (loaded < total) {
        if (m_shutdown.load()) return;

        size_t chunk = static_cast<size_t>(std::min<uint64_t>(m_chunkSize, total - loaded));
        if (!file.read(reinterpret_cast<char*>(data.data() + loaded), static_cast<std::streamsize>(chunk))) {
            fail(callbacks, {LoadErrorKind::Io, path, "Read error after " + std::to_string(loaded) + " bytes"});
            return;
        }
        loaded += chunk;

        if (callbacks.onProgress) {
            auto onProgress = callbacks.onProgress;
            m_events.post([onProgress, loaded, total]() {
                onProgress(loaded, total);
            });
        }
    }

    LoadError error;
    std::unique_ptr<SceneNode> root = parse(data, path, error);
    if (m_shutdown.load()) return;

    if (!root) {
        fail(callbacks, std::move(error));
        return;
    }

    // std::function must be copyable, so the node travels in a shared holder
    auto holder = std::make_shared<std::unique_ptr<SceneNode>>(std::move(root));
    auto onSuccess = callbacks.onSuccess;
    m_events.post([onSuccess, holder]() {
        if (onSuccess) {
            onSuccess(std::move(*holder));
        }
    });
}

// ============================================================================
// cgltf -> SceneNode conversion
// ============================================================================

static LoadErrorKind errorKindFor(cgltf_result result) {
    switch (result) {
        case cgltf_result_file_not_found: return LoadErrorKind::NotFound;
        case cgltf_result_io_error:       return LoadErrorKind::Io;
        default:                          return LoadErrorKind::Parse;
    }
}

static const char* resultName(cgltf_result result) {
    switch (result) {
        case cgltf_result_success:         return "success";
        case cgltf_result_data_too_short:  return "data too short";
        case cgltf_result_unknown_format:  return "unknown format";
        case cgltf_result_invalid_json:    return "invalid JSON";
        case cgltf_result_invalid_gltf:    return "invalid GLTF";
        case cgltf_result_invalid_options: return "invalid options";
        case cgltf_result_file_not_found:  return "file not found";
        case cgltf_result_io_error:        return "I/O error";
        case cgltf_result_out_of_memory:   return "out of memory";
        case cgltf_result_legacy_gltf:     return "legacy GLTF 1.0";
        default:                           return "unknown error";
    }
}

// Split an explicit node matrix back into TRS
static void applyMatrix(const float* m, SceneNode& node) {
    glm::mat4 mat = glm::make_mat4(m);
    node.position = glm::vec3(mat[3]);

    glm::vec3 axisX(mat[0]), axisY(mat[1]), axisZ(mat[2]);
    node.scale = glm::vec3(glm::length(axisX), glm::length(axisY), glm::length(axisZ));

    if (node.scale.x > 0.0f && node.scale.y > 0.0f && node.scale.z > 0.0f) {
        glm::mat3 rot(axisX / node.scale.x, axisY / node.scale.y, axisZ / node.scale.z);
        node.rotation = glm::normalize(glm::quat_cast(rot));
    }
}

static Material convertMaterial(const cgltf_material* mat) {
    // glTF default material is metallic-roughness with both factors at 1
    if (!mat) {
        return PbrMaterial{};
    }

    std::string name = mat->name ? mat->name : "";

    if (mat->unlit) {
        UnlitMaterial unlit;
        unlit.name = name;
        if (mat->has_pbr_metallic_roughness) {
            unlit.color = glm::make_vec4(mat->pbr_metallic_roughness.base_color_factor);
        }
        return unlit;
    }

    if (mat->has_pbr_specular_glossiness) {
        const auto& sg = mat->pbr_specular_glossiness;
        SpecularGlossinessMaterial specGloss;
        specGloss.name = name;
        specGloss.diffuseColor = glm::make_vec4(sg.diffuse_factor);
        specGloss.specularColor = glm::make_vec3(sg.specular_factor);
        specGloss.glossiness = sg.glossiness_factor;
        return specGloss;
    }

    PbrMaterial pbr;
    pbr.name = name;
    if (mat->has_pbr_metallic_roughness) {
        const auto& mr = mat->pbr_metallic_roughness;
        pbr.baseColor = glm::make_vec4(mr.base_color_factor);
        pbr.roughness = mr.roughness_factor;
        pbr.metalness = mr.metallic_factor;
    }
    return pbr;
}

static std::unique_ptr<SceneNode> convertPrimitive(const cgltf_primitive& primitive, const std::string& name) {
    if (primitive.type != cgltf_primitive_type_triangles) {
        return nullptr;  // Only triangle primitives carry renderable geometry
    }

    const cgltf_accessor* posAccessor = nullptr;
    for (size_t i = 0; i < primitive.attributes_count; ++i) {
        if (primitive.attributes[i].type == cgltf_attribute_type_position) {
            posAccessor = primitive.attributes[i].data;
            break;
        }
    }
    if (!posAccessor || posAccessor->count == 0) {
        return nullptr;
    }

    auto mesh = std::make_unique<MeshData>();
    mesh->positions.resize(posAccessor->count);
    for (size_t v = 0; v < posAccessor->count; ++v) {
        float p[3] = {0.0f, 0.0f, 0.0f};
        cgltf_accessor_read_float(posAccessor, v, p, 3);
        mesh->positions[v] = glm::vec3(p[0], p[1], p[2]);
    }

    if (primitive.indices) {
        mesh->indices.resize(primitive.indices->count);
        for (size_t i = 0; i < primitive.indices->count; ++i) {
            mesh->indices[i] = static_cast<uint32_t>(cgltf_accessor_read_index(primitive.indices, i));
        }
    }
    mesh->computeBounds();

    auto node = std::make_unique<SceneNode>(name);
    node->mesh = std::move(mesh);
    node->material = convertMaterial(primitive.material);
    return node;
}

static std::unique_ptr<SceneNode> convertNode(const cgltf_node* src, size_t& meshCount) {
    auto node = std::make_unique<SceneNode>(src->name ? src->name : "");

    if (src->has_matrix) {
        applyMatrix(src->matrix, *node);
    } else {
        if (src->has_translation) {
            node->position = glm::make_vec3(src->translation);
        }
        if (src->has_rotation) {
            // cgltf stores quaternions as (x, y, z, w)
            node->rotation = glm::quat(src->rotation[3], src->rotation[0], src->rotation[1], src->rotation[2]);
        }
        if (src->has_scale) {
            node->scale = glm::make_vec3(src->scale);
        }
    }

    // Each primitive becomes a child mesh node so it can carry its own material
    if (src->mesh) {
        std::string meshName = src->mesh->name ? src->mesh->name : node->name();
        for (size_t p = 0; p < src->mesh->primitives_count; ++p) {
            auto prim = convertPrimitive(src->mesh->primitives[p], meshName + "_" + std::to_string(p));
            if (prim) {
                node->addChild(std::move(prim));
                meshCount++;
            }
        }
    }

    for (size_t c = 0; c < src->children_count; ++c) {
        node->addChild(convertNode(src->children[c], meshCount));
    }

    return node;
}

std::unique_ptr<SceneNode> GltfMeshSource::parse(const std::vector<uint8_t>& data,
                                                 const std::string& path,
                                                 LoadError& outError) {
    outError = LoadError{};
    outError.path = path;

    cgltf_options options = {};
    cgltf_data* gltf = nullptr;

    cgltf_result result = cgltf_parse(&options, data.data(), data.size(), &gltf);
    if (result != cgltf_result_success) {
        outError.kind = errorKindFor(result);
        outError.message = std::string("Failed to parse GLTF file (") + resultName(result) + "): " + path;
        return nullptr;
    }

    // External .bin files resolve relative to the document path
    result = cgltf_load_buffers(&options, gltf, path.c_str());
    if (result != cgltf_result_success) {
        outError.kind = errorKindFor(result);
        outError.message = std::string("Failed to load GLTF buffers (") + resultName(result) + "): " + path;
        cgltf_free(gltf);
        return nullptr;
    }

    // Accessor ranges, index bounds and node cycles are only checked here
    result = cgltf_validate(gltf);
    if (result != cgltf_result_success) {
        outError.kind = LoadErrorKind::Parse;
        outError.message = std::string("Invalid GLTF file (") + resultName(result) + "): " + path;
        cgltf_free(gltf);
        return nullptr;
    }

    // Gather root nodes: default scene, else first scene, else parentless nodes
    std::vector<const cgltf_node*> roots;
    const cgltf_scene* scene = gltf->scene;
    if (!scene && gltf->scenes_count > 0) {
        scene = &gltf->scenes[0];
    }
    if (scene) {
        for (size_t i = 0; i < scene->nodes_count; ++i) {
            roots.push_back(scene->nodes[i]);
        }
    } else {
        for (size_t i = 0; i < gltf->nodes_count; ++i) {
            if (!gltf->nodes[i].parent) {
                roots.push_back(&gltf->nodes[i]);
            }
        }
    }

    auto root = std::make_unique<SceneNode>(fs::path(path).stem().string());
    size_t meshCount = 0;
    for (const cgltf_node* n : roots) {
        root->addChild(convertNode(n, meshCount));
    }

    cgltf_free(gltf);

    if (meshCount == 0) {
        outError.kind = LoadErrorKind::EmptyScene;
        outError.message = "GLTF file contains no triangle meshes: " + path;
        return nullptr;
    }

    return root;
}

} // namespace diorama
