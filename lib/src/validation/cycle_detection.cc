//
// Cycle detection over the model relationship graph
//
// Models are nodes, relationships are directed edges source -> target.
// Every elementary cycle is enumerated by a depth-first walk from each
// start node that only enters nodes ordered after the start; this reports
// each cycle exactly once, rooted at its earliest model, and keeps cycles
// that share a prefix distinct.
//

#include <apigen/validation.hh>

#include <algorithm>
#include <map>

namespace apigen::validation {

namespace {
    using adjacency = std::vector<std::vector<size_t>>;

    adjacency build_graph(const std::vector<ir::model>& models) {
        std::map<std::string, size_t> index_of;
        for (size_t i = 0; i < models.size(); ++i) {
            index_of.emplace(models[i].name, i);  // first definition wins
        }

        adjacency graph(models.size());
        for (size_t i = 0; i < models.size(); ++i) {
            for (const auto& rel : models[i].relationships) {
                auto it = index_of.find(rel.target_model);
                if (it == index_of.end()) {
                    continue;  // missing targets are referential errors, not edges
                }
                auto& edges = graph[i];
                if (std::find(edges.begin(), edges.end(), it->second) == edges.end()) {
                    edges.push_back(it->second);
                }
            }
        }
        return graph;
    }

    class cycle_finder {
    public:
        cycle_finder(const std::vector<ir::model>& models, const adjacency& graph)
            : models_(models), graph_(graph), on_path_(models.size(), false) {}

        std::vector<circular_reference> run() {
            for (size_t start = 0; start < graph_.size(); ++start) {
                start_ = start;
                walk(start);
            }
            return std::move(found_);
        }

    private:
        void walk(size_t node) {
            path_.push_back(node);
            on_path_[node] = true;

            for (size_t next : graph_[node]) {
                if (next == start_) {
                    report();
                } else if (next > start_ && !on_path_[next]) {
                    walk(next);
                }
            }

            on_path_[node] = false;
            path_.pop_back();
        }

        void report() {
            circular_reference ref;
            ref.path.reserve(path_.size() + 1);
            for (size_t n : path_) {
                ref.path.push_back(models_[n].name);
            }
            ref.path.push_back(models_[start_].name);
            found_.push_back(std::move(ref));
        }

        const std::vector<ir::model>& models_;
        const adjacency& graph_;
        std::vector<bool> on_path_;
        std::vector<size_t> path_;
        size_t start_ = 0;
        std::vector<circular_reference> found_;
    };
} // anonymous namespace

std::string circular_reference::format() const {
    std::string out;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) out += " -> ";
        out += path[i];
    }
    return out;
}

std::vector<circular_reference> detect_cycles(const std::vector<ir::model>& models) {
    const adjacency graph = build_graph(models);
    return cycle_finder(models, graph).run();
}

} // namespace apigen::validation
