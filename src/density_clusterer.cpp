#include "density_clusterer.hpp"
#include "util.hpp"
#include <deque>

namespace {

std::vector<size_t> neighbours_of(const PointList& pts, size_t i, double r2){
    std::vector<size_t> out;
    for (size_t j = 0; j < pts.size(); ++j){
        if (j == i) continue;
        if (sq(pts[i].x - pts[j].x) + sq(pts[i].y - pts[j].y) <= r2) out.push_back(j);
    }
    return out;
}

}

std::vector<int> Dbscan::label(const PointList& pts, double radius, int min_neighbours){
    const int UNVISITED = -2;
    std::vector<int> labels(pts.size(), UNVISITED);
    const double r2 = radius * radius;
    int cluster = 0;

    for (size_t i = 0; i < pts.size(); ++i){
        if (labels[i] != UNVISITED) continue;
        auto seeds = neighbours_of(pts, i, r2);
        if ((int)seeds.size() < min_neighbours){
            labels[i] = NOISE_LABEL; // may still become a border point later
            continue;
        }
        labels[i] = cluster;
        std::deque<size_t> queue(seeds.begin(), seeds.end());
        while (!queue.empty()){
            size_t j = queue.front(); queue.pop_front();
            if (labels[j] == NOISE_LABEL) labels[j] = cluster;
            if (labels[j] != UNVISITED) continue;
            labels[j] = cluster;
            auto more = neighbours_of(pts, j, r2);
            if ((int)more.size() >= min_neighbours)
                for (size_t q : more) queue.push_back(q);
        }
        cluster++;
    }
    return labels;
}
