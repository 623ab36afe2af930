#include "skim/compute_matrices.h"

#include <atomic>
#include <exception>
#include <thread>

#include "fmt/core.h"

#include "utl/progress_tracker.h"
#include "utl/to_vec.h"
#include "utl/verify.h"

#include "skim/access_egress.h"
#include "skim/logging.h"
#include "skim/row_worker.h"

namespace skim {

pt_indicators compute_indicators(
    routing::stop_index const& stops,
    routing::tree_builder_factory_t const& make_router,
    std::vector<std::vector<coord>> const& samples,
    skim_settings const& settings,
    routing::routing_parameters const& params,
    train_classifier_t const& is_train) {
  settings.verify();
  params.verify();

  auto const n_zones = static_cast<std::uint32_t>(samples.size());
  auto const n_workers = settings.n_workers();
  auto const name =
      fmt::format("PT-FrequencyMatrix-{}-{}",
                  format_time(settings.min_departure_time_),
                  format_time(settings.max_departure_time_));

  log(log_lvl::info, "skim.compute",
      "{}: {} zones, {} departures per point, {} workers", name, n_zones,
      settings.n_departures(), n_workers);

  auto pti = pt_indicators{n_zones};

  // egress stops only depend on the destination point: resolve them once
  auto const egress = utl::to_vec(samples, [&](std::vector<coord> const& pts) {
    return utl::to_vec(
        pts, [&](coord const& p) { return walk_offsets(stops, p, params); });
  });

  auto origins = std::vector<zone_idx_t>{};
  origins.reserve(n_zones);
  for (auto z = zone_idx_t{0U}; z != zone_idx_t{n_zones}; ++z) {
    origins.emplace_back(z);
  }
  auto next_origin = std::atomic_size_t{0U};

  auto progress_tracker = utl::get_active_progress_tracker_or_activate(name);
  progress_tracker->status(name).reset_bounds().in_high(n_zones);

  auto ctx = matrix_context{.stops_ = stops,
                            .params_ = params,
                            .settings_ = settings,
                            .is_train_ = is_train,
                            .samples_ = samples,
                            .egress_ = egress,
                            .pti_ = pti,
                            .origins_ = origins,
                            .next_origin_ = next_origin,
                            .progress_ = progress_tracker};

  {
    auto const timer = scoped_timer{name};

    // one oracle per worker, created before any thread starts
    auto workers = std::vector<row_worker>{};
    workers.reserve(n_workers);
    for (auto i = 0U; i != n_workers; ++i) {
      auto router = make_router();
      utl::verify(router != nullptr, "router factory returned null");
      workers.emplace_back(ctx, std::move(router));
    }

    auto errors = std::vector<std::exception_ptr>(n_workers);
    auto threads = std::vector<std::thread>{};
    threads.reserve(n_workers);
    for (auto i = 0U; i != n_workers; ++i) {
      threads.emplace_back([&, i]() {
        try {
          workers[i].run();
        } catch (...) {
          errors[i] = std::current_exception();
        }
      });
    }

    for (auto& t : threads) {
      t.join();
    }

    for (auto const& e : errors) {
      if (e != nullptr) {
        log(log_lvl::error, "skim.compute", "{}: worker failed", name);
        std::rethrow_exception(e);
      }
    }
  }

  {
    auto const timer = scoped_timer{name + " finalize"};
    pti.finalize(settings.max_departure_time_ - settings.min_departure_time_);
  }

  return pti;
}

}  // namespace skim
