#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

#include "catalog/station_catalog.hpp"
#include "geocode/geocode_cache.hpp"
#include "io/catalog_loader.hpp"
#include "io/config_io.hpp"
#include "io/gazetteer_geocoder.hpp"
#include "io/output_writer.hpp"
#include "io/request_io.hpp"
#include "pipeline/pipeline.hpp"

namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitBadRequest = 2;
constexpr int kExitPlanFailed = 3;

int ExitCodeFor(fuelroute::PlanStatus status) {
  switch (status) {
    case fuelroute::PlanStatus::kOk:
      return kExitOk;
    case fuelroute::PlanStatus::kEmptyRoute:
    case fuelroute::PlanStatus::kInvalidVehicleProfile:
      return kExitBadRequest;
    case fuelroute::PlanStatus::kNoStationsInCorridor:
    case fuelroute::PlanStatus::kUnreachableDestination:
      return kExitPlanFailed;
  }
  return kExitError;
}

} // namespace

int main(int argc, char** argv) {
  // 默认使用 demo/input 和 demo/output
  // 你可以运行：
  //   ./fuel_route_demo
  // 或指定路径：
  //   ./fuel_route_demo /path/to/input /path/to/output
  //
  // input 目录：
  //   config.json     规划参数（可选）
  //   stations.csv    加油站目录
  //   request.json    起终点 + 路径服务返回的路线
  //   gazetteer.json  离线地名表（起终点 geocoding）
  std::string input_dir  = "demo/input";
  std::string output_dir = "demo/output";

  if (argc >= 2) input_dir = argv[1];
  if (argc >= 3) output_dir = argv[2];

  const fs::path in(input_dir);

  try {
    // 1) 参数 + 目录（进程内只加载一次）
    const fuelroute::PlannerConfig cfg = fuelroute::io::ConfigIO::Load((in / "config.json").string());

    fuelroute::io::CatalogLoadReport report;
    const fuelroute::StationCatalog catalog =
        fuelroute::io::CatalogLoader::LoadCsv((in / "stations.csv").string(), &report);
    std::cout << "Catalog: " << catalog.Size() << " stations loaded ("
              << report.rows_skipped << " rows skipped, "
              << report.duplicates_dropped << " duplicate ids dropped)\n";
    if (report.rows_skipped > 0) {
      std::cerr << "WARN: " << report.rows_skipped << " malformed catalog rows were ignored\n";
    }

    // 2) 请求 + 起终点 geocoding（经缓存）
    const fuelroute::io::RouteRequest req =
        fuelroute::io::RequestIO::Load((in / "request.json").string());

    fuelroute::io::GazetteerGeocoder geocoder =
        fuelroute::io::GazetteerGeocoder::Load((in / "gazetteer.json").string());
    fuelroute::GeocodeCache cache(&geocoder, cfg.geocode.cache_capacity);

    fuelroute::PlanningContext ctx;
    ctx.catalog = &catalog;
    ctx.route = req.route;
    ctx.vehicle = cfg.vehicle;
    ctx.corridor = cfg.corridor;
    ctx.endpoints.start_label = req.start;
    ctx.endpoints.end_label = req.end;
    try {
      ctx.endpoints.start_coord = cache.Resolve(req.start + cfg.geocode.country_suffix);
      ctx.endpoints.end_coord = cache.Resolve(req.end + cfg.geocode.country_suffix);
    } catch (const fuelroute::GeocodeError& e) {
      std::cerr << "ERROR: " << e.what() << "\n";
      return kExitBadRequest;
    }
    const auto stats = cache.GetStats();
    std::cout << "Geocode cache: " << stats.hits << " hits, " << stats.misses << " misses, "
              << stats.evictions << " evictions\n";

    // 3) 跑完整流程
    fuelroute::Pipeline pipe;
    const fuelroute::PlanStatus status = pipe.Run(ctx);
    std::cout << "Corridor: " << ctx.candidates.size() << " stations within "
              << cfg.corridor.max_corridor_km << " km of the route\n";

    if (status != fuelroute::PlanStatus::kOk) {
      fuelroute::io::OutputWriter::WriteFailure(*ctx.failure, output_dir);
      std::cerr << "ERROR: [" << fuelroute::ToString(status) << "] " << ctx.failure->message << "\n";
      return ExitCodeFor(status);
    }

    // 4) 输出（plan.json + fuel_stops.csv）
    fuelroute::io::OutputWriter::WriteAll(ctx, cfg.output, output_dir);

    std::cout << std::fixed << std::setprecision(2)
              << "Plan: " << ctx.plan.stops.size() << " stops, "
              << ctx.plan.total_gallons << " gallons, $" << ctx.plan.total_cost << "\n";
    std::cout << "Done. Output written to: " << output_dir << "\n";
    return kExitOk;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return kExitError;
  }
}
