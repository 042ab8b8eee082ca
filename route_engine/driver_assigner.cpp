#include "driver_assigner.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>

using namespace std;

const vector<string> ROUTE_COLORS = {
    "#9b59b6", "#e91e63", "#00bcd4", "#4caf50", "#ff9800",
    "#2196f3", "#f44336", "#009688", "#ffc107", "#795548",
    "#607d8b", "#9c27b0", "#ff5722", "#00acc1", "#8bc34a",
};

// Whole UTF-8 code points from the front of word; only ASCII is upper-cased.
static string leading_chars(const string& word, int count)
{
    string out;
    size_t i = 0;
    while (count-- > 0 && i < word.size()) {
        size_t start = i++;
        while (i < word.size() && ((unsigned char)word[i] & 0xC0) == 0x80) i++;
        string ch = word.substr(start, i - start);
        if (ch.size() == 1) ch[0] = toupper((unsigned char)ch[0]);
        out += ch;
    }
    return out;
}

string route_name_for(const string& driver_name, int route_index)
{
    stringstream ss(driver_name);
    vector<string> words;
    string w;
    while (ss >> w) words.push_back(w);

    if (words.size() >= 2) return leading_chars(words[0], 1) + leading_chars(words[1], 1);
    if (words.size() == 1) return leading_chars(words[0], 2);
    return "R" + std::to_string(route_index + 1);
}

static RouteAssignment make_assignment(const Cluster& cluster,
                                       const Driver& driver,
                                       const vector<Stop>& orders,
                                       int route_index)
{
    RouteAssignment a;
    a.driver_id = driver.id;
    a.driver_name = driver.name.empty() ? "Driver " + std::to_string(driver.id) : driver.name;
    a.order_indices = cluster;
    for (int idx : cluster) {
        if (idx >= 0 && idx < (int)orders.size()) a.order_ids.push_back(orders[idx].id);
    }
    a.route_name = route_name_for(driver.name, route_index);
    a.color = ROUTE_COLORS[route_index % ROUTE_COLORS.size()];
    a.route_index = route_index;
    return a;
}

vector<RouteAssignment> assign_drivers(const vector<Cluster>& clusters,
                                       const vector<Driver>& drivers,
                                       const vector<Stop>& orders,
                                       AssignmentStrategy strategy)
{
    vector<RouteAssignment> assignments;

    vector<Driver> available;
    for (auto &d : drivers)
        if (d.available) available.push_back(d);
    if (clusters.empty() || available.empty()) return assignments;

    if (strategy == AssignmentStrategy::Balanced) {
        vector<int> by_size(clusters.size());
        for (int i = 0; i < (int)clusters.size(); i++) by_size[i] = i;
        stable_sort(by_size.begin(), by_size.end(), [&](int a, int b) {
            return clusters[a].size() > clusters[b].size();
        });

        // driver id -> running order count; std::map keeps ties on the lowest id
        map<int, size_t> load;
        map<int, const Driver*> by_id;
        for (auto &d : available) {
            load.emplace(d.id, 0);
            by_id.emplace(d.id, &d);
        }

        for (int cidx : by_size) {
            auto least = min_element(load.begin(), load.end(), [](const auto& a, const auto& b) {
                return a.second < b.second;
            });
            least->second += clusters[cidx].size();
            int route_index = assignments.size();
            assignments.push_back(make_assignment(clusters[cidx], *by_id[least->first], orders, route_index));
        }

        stable_sort(assignments.begin(), assignments.end(), [](const RouteAssignment& a, const RouteAssignment& b) {
            return a.driver_id < b.driver_id;
        });
    } else {
        for (int cidx = 0; cidx < (int)clusters.size(); cidx++) {
            const Driver& d = available[cidx % available.size()];
            assignments.push_back(make_assignment(clusters[cidx], d, orders, cidx));
        }
    }

    return assignments;
}
