// PyBind11 bindings for the kgraph C++ core.
// Exposes the data types and the collection-scoped engine to Python.
// Property bags cross the boundary as JSON text.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DKGRAPH_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "engine/knowledge_graph_engine.hpp"
#include "store/memory_record_store.hpp"
#include "graph/properties.hpp"
#include "common/errors.hpp"

#include <json/json.h>

#include <memory>

namespace py = pybind11;

namespace {

kgraph::Properties parseJson(const std::string& text) {
    if (text.empty()) return kgraph::Properties(Json::objectValue);
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value value;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &value, &errors)) {
        throw kgraph::ValidationError("json", errors);
    }
    return value;
}

std::string dumpJson(const Json::Value& value) {
    return kgraph::stringifyProperties(value);
}

} // namespace

PYBIND11_MODULE(kgraph_bindings, m) {
    m.doc() = "kgraph C++ Core Bindings";

    // ── Errors (base first; subclasses are matched before it) ──
    auto& graph_error = py::register_exception<kgraph::GraphError>(m, "GraphError");
    py::register_exception<kgraph::DuplicateIdError>(m, "DuplicateIdError", graph_error.ptr());
    py::register_exception<kgraph::NotFoundError>(m, "NotFoundError", graph_error.ptr());
    py::register_exception<kgraph::EndpointNotFoundError>(m, "EndpointNotFoundError", graph_error.ptr());
    py::register_exception<kgraph::ValidationError>(m, "ValidationError", graph_error.ptr());
    py::register_exception<kgraph::StoreError>(m, "StoreError", graph_error.ptr());

    // ── Enums ──
    py::enum_<kgraph::Direction>(m, "Direction")
        .value("OUT", kgraph::Direction::Out)
        .value("IN", kgraph::Direction::In)
        .value("BOTH", kgraph::Direction::Both);

    py::enum_<kgraph::PropertyUpdate>(m, "PropertyUpdate")
        .value("REPLACE", kgraph::PropertyUpdate::Replace)
        .value("MERGE", kgraph::PropertyUpdate::Merge);

    m.def("parse_direction", &kgraph::parseDirection);

    // ── Node ──
    py::class_<kgraph::Node>(m, "Node")
        .def(py::init<>())
        .def_readwrite("id", &kgraph::Node::id)
        .def_readwrite("name", &kgraph::Node::name)
        .def_readwrite("type", &kgraph::Node::type)
        .def_property("properties",
             [](const kgraph::Node& n) { return dumpJson(n.properties); },
             [](kgraph::Node& n, const std::string& text) {
                 n.properties = kgraph::checkedProperties(parseJson(text), "node " + n.id);
             })
        .def_readwrite("created_at", &kgraph::Node::created_at)
        .def_readwrite("updated_at", &kgraph::Node::updated_at);

    // ── Edge ──
    py::class_<kgraph::Edge>(m, "Edge")
        .def(py::init<>())
        .def_readwrite("id", &kgraph::Edge::id)
        .def_readwrite("source", &kgraph::Edge::source)
        .def_readwrite("target", &kgraph::Edge::target)
        .def_readwrite("relation_type", &kgraph::Edge::relation_type)
        .def_property("properties",
             [](const kgraph::Edge& e) { return dumpJson(e.properties); },
             [](kgraph::Edge& e, const std::string& text) {
                 e.properties = kgraph::checkedProperties(parseJson(text), "edge " + e.id);
             })
        .def_readwrite("weight", &kgraph::Edge::weight)
        .def_readwrite("created_at", &kgraph::Edge::created_at)
        .def_readwrite("updated_at", &kgraph::Edge::updated_at);

    // ── Inputs and patches ──
    py::class_<kgraph::NodeInput>(m, "NodeInput")
        .def(py::init<>())
        .def_readwrite("id", &kgraph::NodeInput::id)
        .def_readwrite("name", &kgraph::NodeInput::name)
        .def_readwrite("type", &kgraph::NodeInput::type)
        .def_property("properties",
             [](const kgraph::NodeInput& n) { return dumpJson(n.properties); },
             [](kgraph::NodeInput& n, const std::string& text) { n.properties = parseJson(text); });

    py::class_<kgraph::EdgeInput>(m, "EdgeInput")
        .def(py::init<>())
        .def_readwrite("id", &kgraph::EdgeInput::id)
        .def_readwrite("source", &kgraph::EdgeInput::source)
        .def_readwrite("target", &kgraph::EdgeInput::target)
        .def_readwrite("relation_type", &kgraph::EdgeInput::relation_type)
        .def_property("properties",
             [](const kgraph::EdgeInput& e) { return dumpJson(e.properties); },
             [](kgraph::EdgeInput& e, const std::string& text) { e.properties = parseJson(text); })
        .def_readwrite("weight", &kgraph::EdgeInput::weight);

    py::class_<kgraph::NodePatch>(m, "NodePatch")
        .def(py::init<>())
        .def_readwrite("name", &kgraph::NodePatch::name)
        .def_readwrite("type", &kgraph::NodePatch::type)
        .def_readwrite("clear_type", &kgraph::NodePatch::clear_type)
        .def("set_properties", [](kgraph::NodePatch& p, const std::string& text) {
            p.properties = parseJson(text);
        })
        .def_readwrite("property_update", &kgraph::NodePatch::property_update);

    py::class_<kgraph::EdgePatch>(m, "EdgePatch")
        .def(py::init<>())
        .def_readwrite("source", &kgraph::EdgePatch::source)
        .def_readwrite("target", &kgraph::EdgePatch::target)
        .def_readwrite("relation_type", &kgraph::EdgePatch::relation_type)
        .def_readwrite("clear_relation_type", &kgraph::EdgePatch::clear_relation_type)
        .def("set_properties", [](kgraph::EdgePatch& p, const std::string& text) {
            p.properties = parseJson(text);
        })
        .def_readwrite("property_update", &kgraph::EdgePatch::property_update)
        .def_readwrite("weight", &kgraph::EdgePatch::weight);

    // ── Results ──
    py::class_<kgraph::BatchFailure>(m, "BatchFailure")
        .def_readonly("index", &kgraph::BatchFailure::index)
        .def_readonly("id", &kgraph::BatchFailure::id)
        .def_property_readonly("kind", [](const kgraph::BatchFailure& f) {
            return std::string(kgraph::errorKindName(f.kind));
        })
        .def_readonly("message", &kgraph::BatchFailure::message);

    py::class_<kgraph::BatchResult>(m, "BatchResult")
        .def_readonly("succeeded", &kgraph::BatchResult::succeeded)
        .def_readonly("failed", &kgraph::BatchResult::failed)
        .def_readonly("created_ids", &kgraph::BatchResult::created_ids)
        .def_readonly("failures", &kgraph::BatchResult::failures);

    py::class_<kgraph::NeighborHit>(m, "NeighborHit")
        .def_readonly("node", &kgraph::NeighborHit::node)
        .def_readonly("depth", &kgraph::NeighborHit::depth)
        .def_readonly("via_edge_id", &kgraph::NeighborHit::via_edge_id);

    py::class_<kgraph::NeighborResult>(m, "NeighborResult")
        .def_readonly("start_id", &kgraph::NeighborResult::start_id)
        .def_readonly("nodes", &kgraph::NeighborResult::nodes)
        .def_readonly("edges", &kgraph::NeighborResult::edges)
        .def("node_ids", &kgraph::NeighborResult::nodeIds);

    py::class_<kgraph::Path>(m, "Path")
        .def_readonly("node_ids", &kgraph::Path::node_ids)
        .def_readonly("edges", &kgraph::Path::edges)
        .def("hops", &kgraph::Path::hops)
        .def("total_weight", &kgraph::Path::totalWeight);

    py::class_<kgraph::GraphStats>(m, "GraphStats")
        .def_readonly("node_count", &kgraph::GraphStats::node_count)
        .def_readonly("edge_count", &kgraph::GraphStats::edge_count)
        .def_readonly("isolated_node_count", &kgraph::GraphStats::isolated_node_count)
        .def_readonly("untyped_node_count", &kgraph::GraphStats::untyped_node_count)
        .def_readonly("max_in_degree", &kgraph::GraphStats::max_in_degree)
        .def_readonly("max_out_degree", &kgraph::GraphStats::max_out_degree)
        .def_readonly("avg_degree", &kgraph::GraphStats::avg_degree)
        .def_readonly("node_type_counts", &kgraph::GraphStats::node_type_counts)
        .def_readonly("relation_type_counts", &kgraph::GraphStats::relation_type_counts);

    py::class_<kgraph::NodeHit>(m, "NodeHit")
        .def_readonly("node", &kgraph::NodeHit::node)
        .def_readonly("tier", &kgraph::NodeHit::tier);

    py::class_<kgraph::EdgeHit>(m, "EdgeHit")
        .def_readonly("edge", &kgraph::EdgeHit::edge)
        .def_readonly("tier", &kgraph::EdgeHit::tier);

    py::class_<kgraph::ImportSummary>(m, "ImportSummary")
        .def_readonly("nodes_created", &kgraph::ImportSummary::nodes_created)
        .def_readonly("nodes_updated", &kgraph::ImportSummary::nodes_updated)
        .def_readonly("nodes_unchanged", &kgraph::ImportSummary::nodes_unchanged)
        .def_readonly("edges_created", &kgraph::ImportSummary::edges_created)
        .def_readonly("edges_updated", &kgraph::ImportSummary::edges_updated)
        .def_readonly("edges_unchanged", &kgraph::ImportSummary::edges_unchanged);

    py::class_<kgraph::ContextResult>(m, "ContextResult")
        .def_readonly("nodes", &kgraph::ContextResult::nodes)
        .def_readonly("edges", &kgraph::ContextResult::edges)
        .def_readonly("text", &kgraph::ContextResult::text);

    // ── EngineConfig ──
    py::class_<kgraph::EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("max_id_length", &kgraph::EngineConfig::max_id_length)
        .def_readwrite("max_name_length", &kgraph::EngineConfig::max_name_length)
        .def_readwrite("max_type_length", &kgraph::EngineConfig::max_type_length)
        .def_readwrite("max_collection_name_length", &kgraph::EngineConfig::max_collection_name_length)
        .def_readwrite("default_search_limit", &kgraph::EngineConfig::default_search_limit)
        .def_readwrite("max_search_limit", &kgraph::EngineConfig::max_search_limit)
        .def_readwrite("max_neighbor_depth", &kgraph::EngineConfig::max_neighbor_depth)
        .def_readwrite("max_path_length", &kgraph::EngineConfig::max_path_length)
        .def_readwrite("max_paths", &kgraph::EngineConfig::max_paths)
        .def_readwrite("context_max_chars", &kgraph::EngineConfig::context_max_chars)
        .def_readwrite("context_edges_per_node", &kgraph::EngineConfig::context_edges_per_node)
        .def_readwrite("cache_materialized_views", &kgraph::EngineConfig::cache_materialized_views)
        .def_readwrite("max_cached_views", &kgraph::EngineConfig::max_cached_views)
        .def_readwrite("log_level", &kgraph::EngineConfig::log_level);

    m.def("load_config", &kgraph::loadConfig, py::arg("path"));

    // ── Stores ──
    py::class_<kgraph::RecordStore>(m, "RecordStore")
        .def("collections", &kgraph::RecordStore::collections);

    py::class_<kgraph::MemoryRecordStore, kgraph::RecordStore>(m, "MemoryRecordStore")
        .def(py::init<>())
        .def("save_to_file", &kgraph::MemoryRecordStore::saveToFile)
        .def("load_from_file", &kgraph::MemoryRecordStore::loadFromFile);

    // ── KnowledgeGraphEngine ──
    using Engine = kgraph::KnowledgeGraphEngine;
    py::class_<Engine>(m, "KnowledgeGraphEngine")
        .def(py::init<kgraph::RecordStore&, kgraph::EngineConfig>(),
             py::arg("store"), py::arg("config") = kgraph::EngineConfig{},
             py::keep_alive<1, 2>())
        .def("create_node", &Engine::createNode)
        .def("update_node", &Engine::updateNode)
        .def("delete_node", &Engine::deleteNode)
        .def("get_node", &Engine::getNode)
        .def("list_nodes", &Engine::listNodes,
             py::arg("collection"), py::arg("type") = py::none(), py::arg("limit") = 0)
        .def("create_edge", &Engine::createEdge)
        .def("update_edge", &Engine::updateEdge)
        .def("delete_edge", &Engine::deleteEdge)
        .def("get_edge", &Engine::getEdge)
        .def("list_edges", &Engine::listEdges,
             py::arg("collection"), py::arg("node_id") = py::none(),
             py::arg("relation_type") = py::none(), py::arg("limit") = 0)
        .def("batch_create_nodes", &Engine::batchCreateNodes)
        .def("batch_create_edges", &Engine::batchCreateEdges)
        .def("clear_collection", &Engine::clearCollection)
        .def("neighbors", &Engine::neighbors,
             py::arg("collection"), py::arg("node_id"),
             py::arg("direction") = kgraph::Direction::Out, py::arg("max_depth") = 1)
        .def("find_path", &Engine::findPath,
             py::arg("collection"), py::arg("source_id"), py::arg("target_id"),
             py::arg("max_length"), py::arg("direction") = kgraph::Direction::Out)
        .def("find_all_paths", &Engine::findAllPaths,
             py::arg("collection"), py::arg("source_id"), py::arg("target_id"),
             py::arg("max_length"), py::arg("limit") = 0,
             py::arg("direction") = kgraph::Direction::Out)
        .def("stats", &Engine::stats)
        .def("search_nodes",
             py::overload_cast<const std::string&, const std::string&, int>(&Engine::searchNodes),
             py::arg("collection"), py::arg("keyword"), py::arg("limit"))
        .def("search_edges", &Engine::searchEdges,
             py::arg("collection"), py::arg("keyword"), py::arg("limit"))
        .def("export_collection", [](Engine& self, const std::string& collection) {
            return kgraph::GraphExchange::writeDocument(self.exportCollection(collection));
        })
        .def("import_collection", [](Engine& self, const std::string& collection,
                                     const std::string& document, bool clear_existing) {
            return self.importCollection(collection, kgraph::GraphExchange::parseDocument(document),
                                         clear_existing);
        }, py::arg("collection"), py::arg("document"), py::arg("clear_existing") = false)
        .def("export_to_file", &Engine::exportToFile)
        .def("import_from_file", &Engine::importFromFile,
             py::arg("collection"), py::arg("path"), py::arg("clear_existing") = false)
        .def("format_context", &Engine::formatContext,
             py::arg("ranked_nodes"), py::arg("edges"), py::arg("max_chars") = 0)
        .def("query_context", &Engine::queryContext,
             py::arg("collection"), py::arg("query_text"), py::arg("top_k"),
             py::arg("max_chars") = 0)
        .def("collections", &Engine::collections)
        .def("reload_store", &Engine::reloadStore, py::arg("reload"))
        .def("reload_from_file", [](Engine& self, const std::string& path) {
            self.reloadStore([&](kgraph::RecordStore& store) {
                auto* memory = dynamic_cast<kgraph::MemoryRecordStore*>(&store);
                if (!memory) {
                    throw kgraph::StoreError("engine store cannot be loaded from a file", path);
                }
                memory->loadFromFile(path);
            });
        }, py::arg("path"))
        .def_property_readonly("cached_view_count", &Engine::cachedViewCount);
}
