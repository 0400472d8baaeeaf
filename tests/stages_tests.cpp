#include "tests/test_framework.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

// =========================
// Stage-by-stage tests
// =========================
//
// 目标：对 include/stages 下每个 Stage 的“输入/输出契约”做单元/小集成测试。
//
// 说明：
// - 每个 Stage 都把输出写回 PlanningContext（ctx）里对应字段。
// - 失败一律抛 PlanningError，带 PlanStatus；这里直接检查 status。
// - 大部分几何用例放在赤道上：1 度经度 = 111.32 km，投影的 t 值可以手算。
//

#include "catalog/station_catalog.hpp"
#include "stages/corridor_filter_stage.hpp"
#include "stages/fuel_stop_plan_stage.hpp"
#include "stages/route_project_stage.hpp"
#include "stages/route_validate_stage.hpp"

using fuelroute::Coordinate;
using fuelroute::CorridorCandidate;
using fuelroute::PlanningError;
using fuelroute::PlanStatus;
using fuelroute::ProjectedStation;
using fuelroute::RoutePolyline;
using fuelroute::StationRecord;
using fuelroute::VehicleProfile;

namespace {

StationRecord MakeStation(std::string id, double price, double lat, double lon) {
  StationRecord s;
  s.id = std::move(id);
  s.name = "Station " + s.id;
  s.address = "I-0 EXIT " + s.id;
  s.city = "Testville";
  s.state = "KS";
  s.price_per_gallon = price;
  s.coordinate = Coordinate{lat, lon};
  return s;
}

ProjectedStation MakeProjected(std::string id, double mile, double price) {
  ProjectedStation p;
  p.station = MakeStation(std::move(id), price, 0.0, 0.0);
  p.distance_from_start_miles = mile;
  return p;
}

CorridorCandidate MakeCandidate(std::string id, double price, double lat, double lon) {
  CorridorCandidate c;
  c.station = MakeStation(std::move(id), price, lat, lon);
  return c;
}

RoutePolyline EquatorRoute(double total_miles) {
  RoutePolyline r;
  r.points = {{0.0, 0.0}, {0.0, 10.0}};
  r.total_distance_miles = total_miles;
  return r;
}

// 调用 fn，返回抛出的 PlanningError 的 status；没抛则返回 kOk
template <typename Fn>
PlanStatus StatusOf(Fn fn) {
  try {
    fn();
  } catch (const PlanningError& e) {
    return e.status();
  }
  return PlanStatus::kOk;
}

std::vector<std::string> Ids(const std::vector<CorridorCandidate>& v) {
  std::vector<std::string> out;
  for (const auto& c : v) out.push_back(c.station.id);
  return out;
}

std::vector<std::string> Ids(const std::vector<ProjectedStation>& v) {
  std::vector<std::string> out;
  for (const auto& p : v) out.push_back(p.station.id);
  return out;
}

bool SameIds(const std::vector<std::string>& got, const std::vector<std::string>& want) {
  if (got != want) {
    std::cerr << "  ids:";
    for (const auto& id : got) std::cerr << " " << id;
    std::cerr << "\n";
    return false;
  }
  return true;
}

// =========================
// 1) RouteValidateStage
// =========================

bool Test_Validate_RejectsShortRoute() {
  fuelroute::PlanningContext ctx;
  ctx.route.points = {{0.0, 0.0}};
  ctx.route.total_distance_miles = 10.0;

  fuelroute::RouteValidateStage stage;
  FUELROUTE_EXPECT_TRUE(StatusOf([&] { stage.Run(ctx); }) == PlanStatus::kEmptyRoute);

  ctx.route.points.clear();
  FUELROUTE_EXPECT_TRUE(StatusOf([&] { stage.Run(ctx); }) == PlanStatus::kEmptyRoute);
  return true;
}

bool Test_Validate_RejectsBadDistance() {
  fuelroute::PlanningContext ctx;
  ctx.route = EquatorRoute(std::numeric_limits<double>::quiet_NaN());

  fuelroute::RouteValidateStage stage;
  FUELROUTE_EXPECT_TRUE(StatusOf([&] { stage.Run(ctx); }) == PlanStatus::kEmptyRoute);

  ctx.route.total_distance_miles = -1.0;
  FUELROUTE_EXPECT_TRUE(StatusOf([&] { stage.Run(ctx); }) == PlanStatus::kEmptyRoute);

  // 折线有长度但里程为 0：上游丢了 summary.distance，不能当作“零里程”放行
  ctx.route.total_distance_miles = 0.0;
  FUELROUTE_EXPECT_TRUE(StatusOf([&] { stage.Run(ctx); }) == PlanStatus::kEmptyRoute);

  // 起终点重合的退化折线：里程 0 是一致的
  ctx.route.points = {{1.0, 1.0}, {1.0, 1.0}};
  FUELROUTE_EXPECT_TRUE(StatusOf([&] { stage.Run(ctx); }) == PlanStatus::kOk);
  return true;
}

bool Test_Validate_RejectsBadVehicle() {
  fuelroute::PlanningContext ctx;
  ctx.route = EquatorRoute(100.0);
  fuelroute::RouteValidateStage stage;

  ctx.vehicle = VehicleProfile{0.0, 10.0};
  FUELROUTE_EXPECT_TRUE(StatusOf([&] { stage.Run(ctx); }) == PlanStatus::kInvalidVehicleProfile);

  ctx.vehicle = VehicleProfile{500.0, -1.0};
  FUELROUTE_EXPECT_TRUE(StatusOf([&] { stage.Run(ctx); }) == PlanStatus::kInvalidVehicleProfile);

  ctx.vehicle = VehicleProfile{std::numeric_limits<double>::infinity(), 10.0};
  FUELROUTE_EXPECT_TRUE(StatusOf([&] { stage.Run(ctx); }) == PlanStatus::kInvalidVehicleProfile);

  ctx.vehicle = VehicleProfile{500.0, 10.0};
  FUELROUTE_EXPECT_TRUE(StatusOf([&] { stage.Run(ctx); }) == PlanStatus::kOk);
  return true;
}

// =========================
// 2) StationCatalog
// =========================

bool Test_Catalog_DropsDuplicateIdsKeepingFirst() {
  fuelroute::StationCatalog catalog(std::vector<StationRecord>{
      MakeStation("1", 3.0, 0.0, 0.0),
      MakeStation("2", 3.1, 0.0, 1.0),
      MakeStation("1", 9.9, 5.0, 5.0),
  });
  FUELROUTE_EXPECT_EQ(catalog.Size(), static_cast<std::size_t>(2));
  FUELROUTE_EXPECT_EQ(catalog.DroppedDuplicates(), static_cast<std::size_t>(1));

  const StationRecord* s = catalog.FindById("1");
  FUELROUTE_EXPECT_TRUE(s != nullptr);
  FUELROUTE_EXPECT_EQ(s->price_per_gallon, 3.0);
  FUELROUTE_EXPECT_TRUE(catalog.FindById("missing") == nullptr);
  return true;
}

// =========================
// 3) CorridorFilter
// =========================

bool Test_Corridor_KeepsNearbyInCatalogOrder() {
  // bbox 外扩 80 km ≈ 0.72 度
  fuelroute::StationCatalog catalog(std::vector<StationRecord>{
      MakeStation("A", 3.0, 0.5, 5.0),     // ~55 km，保留
      MakeStation("C", 3.0, 30.0, 50.0),   // 盒外
      MakeStation("E", 3.0, 0.5, 10.6),    // 盒内，但离终点 ~87 km
      MakeStation("D", 3.0, 0.3, -0.5),    // 起点之前 ~65 km，保留
      MakeStation("B", 3.0, -0.7, 5.0),    // ~77 km，保留
  });

  const auto out = fuelroute::CorridorFilter::Filter(catalog, EquatorRoute(691.0), 80.0, 80.0);
  FUELROUTE_EXPECT_TRUE(SameIds(Ids(out), {"A", "D", "B"}));

  FUELROUTE_EXPECT_NEAR(out[0].perpendicular_distance_km, 55.29, 0.1);
  for (const auto& c : out) {
    FUELROUTE_EXPECT_TRUE(c.perpendicular_distance_km >= 0.0);
    FUELROUTE_EXPECT_TRUE(c.perpendicular_distance_km <= 80.0);
  }
  return true;
}

bool Test_Corridor_BoundingBoxPrefilterDiscards() {
  // 站点离路线 55 km，走廊 80 km 本应保留；但包围盒只外扩 10 km，粗筛就丢掉
  const std::vector<StationRecord> stations{MakeStation("A", 3.0, 0.5, 5.0)};
  const auto narrow = fuelroute::CorridorFilter::Filter(stations, EquatorRoute(691.0), 10.0, 80.0);
  FUELROUTE_EXPECT_TRUE(narrow.empty());

  const auto wide = fuelroute::CorridorFilter::Filter(stations, EquatorRoute(691.0), 80.0, 80.0);
  FUELROUTE_EXPECT_EQ(wide.size(), static_cast<std::size_t>(1));
  return true;
}

bool Test_Corridor_KeepsStationJustInsideLimit() {
  // 赤道附近 0.722 度纬度 ≈ 79.83 km：外扩 = 走廊 = 80 km 时必须保留
  const std::vector<StationRecord> stations{MakeStation("edge", 3.0, 0.722, 5.0)};
  const auto out = fuelroute::CorridorFilter::Filter(stations, EquatorRoute(691.0), 80.0, 80.0);
  FUELROUTE_EXPECT_EQ(out.size(), static_cast<std::size_t>(1));
  FUELROUTE_EXPECT_NEAR(out[0].perpendicular_distance_km, 79.83, 0.05);
  FUELROUTE_EXPECT_TRUE(out[0].perpendicular_distance_km <= 80.0);
  return true;
}

bool Test_Corridor_DegenerateRouteIsEmpty() {
  const std::vector<StationRecord> stations{MakeStation("A", 3.0, 0.0, 0.0)};

  RoutePolyline one_point;
  one_point.points = {{0.0, 0.0}};
  FUELROUTE_EXPECT_TRUE(fuelroute::CorridorFilter::Filter(stations, one_point, 80.0, 80.0).empty());
  FUELROUTE_EXPECT_TRUE(fuelroute::CorridorFilter::Filter(stations, RoutePolyline{}, 80.0, 80.0).empty());
  return true;
}

bool Test_CorridorStage_NoStationsFails() {
  fuelroute::StationCatalog catalog(std::vector<StationRecord>{MakeStation("far", 3.0, 30.0, 50.0)});

  fuelroute::PlanningContext ctx;
  ctx.catalog = &catalog;
  ctx.route = EquatorRoute(691.0);

  fuelroute::CorridorFilterStage stage;
  FUELROUTE_EXPECT_TRUE(StatusOf([&] { stage.Run(ctx); }) == PlanStatus::kNoStationsInCorridor);
  FUELROUTE_EXPECT_TRUE(ctx.candidates.empty());
  return true;
}

bool Test_CorridorStage_RequiresCatalog() {
  fuelroute::PlanningContext ctx;
  ctx.route = EquatorRoute(691.0);
  fuelroute::CorridorFilterStage stage;
  FUELROUTE_EXPECT_THROW(stage.Run(ctx), std::invalid_argument);
  return true;
}

// =========================
// 4) RouteProjector
// =========================

bool Test_Project_MileMarkersAlongSegments() {
  RoutePolyline route;
  route.points = {{0.0, 0.0}, {0.0, 5.0}, {0.0, 10.0}};
  route.total_distance_miles = 1000.0;

  const std::vector<CorridorCandidate> cands{
      MakeCandidate("late", 3.0, 0.2, 7.5),
      MakeCandidate("early", 3.0, -0.1, 2.5),
  };
  const auto out = fuelroute::RouteProjector::Project(cands, route);

  FUELROUTE_EXPECT_TRUE(SameIds(Ids(out), {"early", "late"}));
  FUELROUTE_EXPECT_NEAR(out[0].distance_from_start_miles, 250.0, 1e-6);
  FUELROUTE_EXPECT_NEAR(out[1].distance_from_start_miles, 750.0, 1e-6);
  return true;
}

bool Test_Project_ScalesToRoadDistance() {
  // 折线长度 ~691.7 英里，但路径服务报 2000 英里：按比例缩放
  const std::vector<CorridorCandidate> cands{MakeCandidate("mid", 3.0, 0.1, 5.0)};
  const auto out = fuelroute::RouteProjector::Project(cands, EquatorRoute(2000.0));
  FUELROUTE_EXPECT_EQ(out.size(), static_cast<std::size_t>(1));
  FUELROUTE_EXPECT_NEAR(out[0].distance_from_start_miles, 1000.0, 1e-6);
  return true;
}

bool Test_Project_ClampsToRouteEnds() {
  const std::vector<CorridorCandidate> cands{
      MakeCandidate("after", 3.0, 0.1, 11.0),
      MakeCandidate("before", 3.0, 0.1, -1.0),
  };
  const auto out = fuelroute::RouteProjector::Project(cands, EquatorRoute(1000.0));

  FUELROUTE_EXPECT_TRUE(SameIds(Ids(out), {"before", "after"}));
  FUELROUTE_EXPECT_EQ(out[0].distance_from_start_miles, 0.0);
  FUELROUTE_EXPECT_NEAR(out[1].distance_from_start_miles, 1000.0, 1e-9);
  FUELROUTE_EXPECT_TRUE(out[1].distance_from_start_miles <= 1000.0);
  return true;
}

bool Test_Project_TieBreakByPriceThenId() {
  const std::vector<CorridorCandidate> cands{
      MakeCandidate("10", 3.0, 0.1, 5.0),
      MakeCandidate("9", 3.0, 0.1, 5.0),
      MakeCandidate("X", 2.5, 0.1, 5.0),
  };
  const auto out = fuelroute::RouteProjector::Project(cands, EquatorRoute(1000.0));
  FUELROUTE_EXPECT_TRUE(SameIds(Ids(out), {"X", "9", "10"}));
  return true;
}

bool Test_Project_ZeroLengthRouteMapsToStart() {
  RoutePolyline route;
  route.points = {{1.0, 1.0}, {1.0, 1.0}};
  route.total_distance_miles = 50.0;

  const std::vector<CorridorCandidate> cands{MakeCandidate("a", 3.0, 1.1, 1.0)};
  const auto out = fuelroute::RouteProjector::Project(cands, route);
  FUELROUTE_EXPECT_EQ(out.size(), static_cast<std::size_t>(1));
  FUELROUTE_EXPECT_EQ(out[0].distance_from_start_miles, 0.0);
  return true;
}

// =========================
// 5) FuelStopPlanner
// =========================

bool Test_Planner_ThreeStopReferenceTrip() {
  // 1200 英里，续航 500：0 -> 100 -> 450 -> 900 -> 终点
  const std::vector<ProjectedStation> st{
      MakeProjected("s100", 100.0, 3.00),
      MakeProjected("s450", 450.0, 3.50),
      MakeProjected("s900", 900.0, 2.80),
  };
  const auto plan = fuelroute::FuelStopPlanner::Plan(st, 1200.0, VehicleProfile{500.0, 10.0});

  FUELROUTE_EXPECT_EQ(plan.stops.size(), static_cast<std::size_t>(3));
  FUELROUTE_EXPECT_EQ(plan.stops[0].station.id, std::string("s100"));
  FUELROUTE_EXPECT_EQ(plan.stops[1].station.id, std::string("s450"));
  FUELROUTE_EXPECT_EQ(plan.stops[2].station.id, std::string("s900"));

  FUELROUTE_EXPECT_NEAR(plan.stops[0].gallons_purchased, 10.0, 1e-9);
  FUELROUTE_EXPECT_NEAR(plan.stops[1].gallons_purchased, 35.0, 1e-9);
  FUELROUTE_EXPECT_NEAR(plan.stops[2].gallons_purchased, 45.0, 1e-9);
  FUELROUTE_EXPECT_NEAR(plan.stops[1].cost, 122.5, 1e-9);
  FUELROUTE_EXPECT_NEAR(plan.total_gallons, 90.0, 1e-9);
  FUELROUTE_EXPECT_NEAR(plan.total_cost, 30.0 + 122.5 + 126.0, 1e-9);
  FUELROUTE_EXPECT_EQ(plan.vehicle.mpg, 10.0);
  return true;
}

bool Test_Planner_ExactRangeNeedsNoStop() {
  const std::vector<ProjectedStation> st{MakeProjected("a", 250.0, 1.0)};
  const auto plan = fuelroute::FuelStopPlanner::Plan(st, 500.0, VehicleProfile{500.0, 10.0});
  FUELROUTE_EXPECT_TRUE(plan.stops.empty());
  FUELROUTE_EXPECT_EQ(plan.total_cost, 0.0);

  // 没有任何站点也一样
  const auto empty = fuelroute::FuelStopPlanner::Plan({}, 499.0, VehicleProfile{500.0, 10.0});
  FUELROUTE_EXPECT_TRUE(empty.stops.empty());
  return true;
}

bool Test_Planner_ReportsGap() {
  const std::vector<ProjectedStation> st{
      MakeProjected("a", 100.0, 3.0),
      MakeProjected("b", 700.0, 3.0),
  };
  bool thrown = false;
  try {
    fuelroute::FuelStopPlanner::Plan(st, 1200.0, VehicleProfile{500.0, 10.0});
  } catch (const PlanningError& e) {
    thrown = true;
    FUELROUTE_EXPECT_TRUE(e.status() == PlanStatus::kUnreachableDestination);
    FUELROUTE_EXPECT_NEAR(e.failure().gap_start_miles, 100.0, 1e-9);
    FUELROUTE_EXPECT_NEAR(e.failure().gap_end_miles, 600.0, 1e-9);
  }
  FUELROUTE_EXPECT_TRUE(thrown);
  return true;
}

bool Test_Planner_GapAtStartClampedToTotal() {
  const std::vector<ProjectedStation> st{MakeProjected("late", 550.0, 3.0)};
  bool thrown = false;
  try {
    fuelroute::FuelStopPlanner::Plan(st, 520.0, VehicleProfile{500.0, 10.0});
  } catch (const PlanningError& e) {
    thrown = true;
    FUELROUTE_EXPECT_EQ(e.failure().gap_start_miles, 0.0);
    FUELROUTE_EXPECT_NEAR(e.failure().gap_end_miles, 500.0, 1e-9);
  }
  FUELROUTE_EXPECT_TRUE(thrown);
  return true;
}

bool Test_Planner_EqualPricePrefersFarther() {
  const std::vector<ProjectedStation> st{
      MakeProjected("near", 200.0, 3.0),
      MakeProjected("far", 400.0, 3.0),
  };
  const auto plan = fuelroute::FuelStopPlanner::Plan(st, 800.0, VehicleProfile{500.0, 10.0});
  FUELROUTE_EXPECT_EQ(plan.stops.size(), static_cast<std::size_t>(1));
  FUELROUTE_EXPECT_EQ(plan.stops[0].station.id, std::string("far"));
  return true;
}

bool Test_Planner_FullTieBrokenById() {
  const std::vector<ProjectedStation> st{
      MakeProjected("20", 300.0, 3.0),
      MakeProjected("3", 300.0, 3.0),
  };
  const auto plan = fuelroute::FuelStopPlanner::Plan(st, 700.0, VehicleProfile{500.0, 10.0});
  FUELROUTE_EXPECT_EQ(plan.stops.size(), static_cast<std::size_t>(1));
  FUELROUTE_EXPECT_EQ(plan.stops[0].station.id, std::string("3"));
  return true;
}

bool Test_Planner_StationAtStartIsNotAStop() {
  const std::vector<ProjectedStation> st{
      MakeProjected("origin", 0.0, 1.0),
      MakeProjected("mid", 300.0, 3.0),
  };
  const auto plan = fuelroute::FuelStopPlanner::Plan(st, 600.0, VehicleProfile{500.0, 10.0});
  FUELROUTE_EXPECT_EQ(plan.stops.size(), static_cast<std::size_t>(1));
  FUELROUTE_EXPECT_EQ(plan.stops[0].station.id, std::string("mid"));
  FUELROUTE_EXPECT_NEAR(plan.stops[0].gallons_purchased, 30.0, 1e-9);
  return true;
}

bool Test_Planner_StopsOnceDestinationReachable() {
  // 窗口内最便宜的是 450；从 450 出发已能到 800，不再加第二站
  const std::vector<ProjectedStation> st{
      MakeProjected("a", 200.0, 2.0),
      MakeProjected("b", 450.0, 1.0),
      MakeProjected("c", 700.0, 0.5),
  };
  const auto plan = fuelroute::FuelStopPlanner::Plan(st, 800.0, VehicleProfile{500.0, 10.0});
  FUELROUTE_EXPECT_EQ(plan.stops.size(), static_cast<std::size_t>(1));
  FUELROUTE_EXPECT_EQ(plan.stops[0].station.id, std::string("b"));
  FUELROUTE_EXPECT_NEAR(plan.stops[0].gallons_purchased, 45.0, 1e-9);
  return true;
}

bool Test_Planner_InvalidVehicle() {
  const std::vector<ProjectedStation> st{MakeProjected("a", 100.0, 3.0)};
  FUELROUTE_EXPECT_TRUE(StatusOf([&] {
                          fuelroute::FuelStopPlanner::Plan(st, 1000.0, VehicleProfile{500.0, 0.0});
                        }) == PlanStatus::kInvalidVehicleProfile);
  FUELROUTE_EXPECT_TRUE(StatusOf([&] {
                          fuelroute::FuelStopPlanner::Plan(st, 1000.0, VehicleProfile{-5.0, 10.0});
                        }) == PlanStatus::kInvalidVehicleProfile);
  return true;
}

bool Test_Planner_UnsortedInputSameResult() {
  const std::vector<ProjectedStation> sorted{
      MakeProjected("s100", 100.0, 3.00),
      MakeProjected("s450", 450.0, 3.50),
      MakeProjected("s900", 900.0, 2.80),
  };
  const std::vector<ProjectedStation> shuffled{sorted[2], sorted[0], sorted[1]};

  const VehicleProfile v{500.0, 10.0};
  const auto a = fuelroute::FuelStopPlanner::Plan(sorted, 1200.0, v);
  const auto b = fuelroute::FuelStopPlanner::Plan(shuffled, 1200.0, v);

  FUELROUTE_EXPECT_EQ(a.stops.size(), b.stops.size());
  for (std::size_t i = 0; i < a.stops.size(); ++i) {
    FUELROUTE_EXPECT_EQ(a.stops[i].station.id, b.stops[i].station.id);
  }
  FUELROUTE_EXPECT_EQ(a.total_cost, b.total_cost);
  return true;
}

bool Test_Planner_LongTripInvariants() {
  // 每 37 英里一个站，价格用 LCG 打散；3000 英里，续航 300
  std::vector<ProjectedStation> st;
  std::uint32_t seed = 12345u;
  for (int mile = 37; mile < 3000; mile += 37) {
    seed = seed * 1103515245u + 12345u;
    const double price = 3.0 + static_cast<double>((seed >> 16) % 150u) / 100.0;
    st.push_back(MakeProjected(std::to_string(mile), static_cast<double>(mile), price));
  }

  const double total = 3000.0;
  const VehicleProfile v{300.0, 6.5};
  const auto plan = fuelroute::FuelStopPlanner::Plan(st, total, v);
  FUELROUTE_EXPECT_TRUE(!plan.stops.empty());

  double prev = 0.0;
  double gallons = 0.0;
  double cost = 0.0;
  for (const auto& s : plan.stops) {
    FUELROUTE_EXPECT_TRUE(s.distance_from_start_miles > prev);
    FUELROUTE_EXPECT_TRUE(s.distance_from_start_miles - prev <= v.range_miles + 1e-9);
    FUELROUTE_EXPECT_TRUE(s.distance_from_start_miles <= total);
    FUELROUTE_EXPECT_NEAR(s.cost, s.gallons_purchased * s.price_per_gallon, 1e-9);
    gallons += s.gallons_purchased;
    cost += s.cost;
    prev = s.distance_from_start_miles;
  }
  FUELROUTE_EXPECT_TRUE(total - prev <= v.range_miles + 1e-9);
  FUELROUTE_EXPECT_NEAR(plan.total_gallons, gallons, 1e-9);
  FUELROUTE_EXPECT_NEAR(plan.total_cost, cost, 1e-9);

  // 同一输入重复规划，结果一致
  const auto again = fuelroute::FuelStopPlanner::Plan(st, total, v);
  FUELROUTE_EXPECT_EQ(again.stops.size(), plan.stops.size());
  for (std::size_t i = 0; i < plan.stops.size(); ++i) {
    FUELROUTE_EXPECT_EQ(again.stops[i].station.id, plan.stops[i].station.id);
  }
  FUELROUTE_EXPECT_EQ(again.total_cost, plan.total_cost);
  return true;
}

bool Test_PlanStage_WritesContext() {
  fuelroute::PlanningContext ctx;
  ctx.route.total_distance_miles = 1200.0;
  ctx.projected = {
      MakeProjected("s100", 100.0, 3.00),
      MakeProjected("s450", 450.0, 3.50),
      MakeProjected("s900", 900.0, 2.80),
  };

  fuelroute::FuelStopPlanStage stage;
  stage.Run(ctx);
  FUELROUTE_EXPECT_EQ(ctx.plan.stops.size(), static_cast<std::size_t>(3));

  // 重跑覆盖旧输出
  stage.Run(ctx);
  FUELROUTE_EXPECT_EQ(ctx.plan.stops.size(), static_cast<std::size_t>(3));
  return true;
}

} // namespace

int main(int argc, char** argv) {
  using fuelroute::test::TestCase;

  std::vector<TestCase> cases = {
      {"Validate: short route", Test_Validate_RejectsShortRoute},
      {"Validate: bad route distance", Test_Validate_RejectsBadDistance},
      {"Validate: bad vehicle", Test_Validate_RejectsBadVehicle},
      {"Catalog: duplicate ids", Test_Catalog_DropsDuplicateIdsKeepingFirst},
      {"Corridor: keeps nearby in catalog order", Test_Corridor_KeepsNearbyInCatalogOrder},
      {"Corridor: bounding box prefilter", Test_Corridor_BoundingBoxPrefilterDiscards},
      {"Corridor: station just inside limit", Test_Corridor_KeepsStationJustInsideLimit},
      {"Corridor: degenerate route", Test_Corridor_DegenerateRouteIsEmpty},
      {"CorridorStage: no stations", Test_CorridorStage_NoStationsFails},
      {"CorridorStage: catalog required", Test_CorridorStage_RequiresCatalog},
      {"Project: mile markers along segments", Test_Project_MileMarkersAlongSegments},
      {"Project: scaled to road distance", Test_Project_ScalesToRoadDistance},
      {"Project: clamped to route ends", Test_Project_ClampsToRouteEnds},
      {"Project: tie-break by price then id", Test_Project_TieBreakByPriceThenId},
      {"Project: zero-length route", Test_Project_ZeroLengthRouteMapsToStart},
      {"Planner: three-stop reference trip", Test_Planner_ThreeStopReferenceTrip},
      {"Planner: exact range needs no stop", Test_Planner_ExactRangeNeedsNoStop},
      {"Planner: reports gap", Test_Planner_ReportsGap},
      {"Planner: gap at start", Test_Planner_GapAtStartClampedToTotal},
      {"Planner: equal price prefers farther", Test_Planner_EqualPricePrefersFarther},
      {"Planner: full tie broken by id", Test_Planner_FullTieBrokenById},
      {"Planner: station at start", Test_Planner_StationAtStartIsNotAStop},
      {"Planner: stops once destination reachable", Test_Planner_StopsOnceDestinationReachable},
      {"Planner: invalid vehicle", Test_Planner_InvalidVehicle},
      {"Planner: unsorted input", Test_Planner_UnsortedInputSameResult},
      {"Planner: long trip invariants", Test_Planner_LongTripInvariants},
      {"PlanStage: writes context", Test_PlanStage_WritesContext},
  };

  return fuelroute::test::RunAll(cases, argc, argv);
}
