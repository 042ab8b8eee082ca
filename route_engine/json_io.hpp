#pragma once
#include "model.hpp"
#include "planner.hpp"
#include "segment_sampler.hpp"
#include <string>
#include <vector>
#include "nlohmann/json.hpp"

// "2024-05-01T08:30:00Z". Fractional seconds and offsets other than Z are not accepted.
bool parse_iso8601(const std::string& s, Timestamp& out);
std::string format_iso8601(Timestamp t);

Stop parse_stop(const nlohmann::json& j, const std::string& default_id);
Driver parse_driver(const nlohmann::json& j);
bool parse_plan_options(const nlohmann::json& j, PlanOverrides& out, std::string& error);

// Reads "mode", "depot", "orders", "drivers", "parking", "start_time" and
// "options". Inline "parking" entries are read here; "parking_file" is left
// to the caller.
bool parse_plan_request(const nlohmann::json& j, PlanRequest& req, std::string& mode, std::string& error);
bool load_plan_request(const std::string& filename, PlanRequest& req, std::string& mode);

std::vector<ParkingCandidate> parse_parking_candidates(const nlohmann::json& j);
bool load_parking_candidates(const std::string& filename, std::vector<ParkingCandidate>& out);
nlohmann::json sampled_points_to_json(const std::vector<SampledParkingPoint>& points);

nlohmann::json parking_to_json(const ParkingCandidate& c);
nlohmann::json route_plan_to_json(const RoutePlan& plan);
nlohmann::json plan_result_to_json(const PlanResult& result);
nlohmann::json reoptimize_result_to_json(const ReoptimizeResult& result, const std::vector<Stop>& stops);
