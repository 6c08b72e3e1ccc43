#pragma once

#include <algorithm>
#include <exception>
#include <functional>
#include <optional>
#include <type_traits>
#include <vector>

#include "abstract_executor.hpp"
#include "utils/assert.hpp"

namespace seqpart {

/**
 * Maps @param function over @param units on @param executor and returns the results in input order.
 *
 * Each unit becomes one job that writes into its own result slot, so jobs share no mutable state. With a non-zero
 * @param wave_size, at most that many jobs are handed to the executor at once; later waves are not started once a
 * wave failed. If any unit failed, the exception of the lowest failing ordinal is rethrown after the executor returned.
 */
template <typename Unit, typename Function>
auto MapUnits(AbstractExecutor& executor, const std::vector<Unit>& units, const Function& function,
              size_t wave_size = 0) -> std::vector<std::invoke_result_t<const Function&, const Unit&>> {
  using Result = std::invoke_result_t<const Function&, const Unit&>;

  std::vector<std::optional<Result>> result_slots(units.size());
  std::vector<std::exception_ptr> error_slots(units.size());
  const size_t effective_wave_size = wave_size == 0 ? std::max<size_t>(units.size(), 1) : wave_size;

  for (size_t wave_begin = 0; wave_begin < units.size(); wave_begin += effective_wave_size) {
    const size_t wave_end = std::min(units.size(), wave_begin + effective_wave_size);

    std::vector<std::function<void()>> jobs;
    jobs.reserve(wave_end - wave_begin);
    for (size_t ordinal = wave_begin; ordinal < wave_end; ++ordinal) {
      jobs.emplace_back([&, ordinal]() {
        try {
          result_slots[ordinal].emplace(function(units[ordinal]));
        } catch (...) {
          error_slots[ordinal] = std::current_exception();
        }
      });
    }

    executor.ExecuteAll(jobs);

    const auto first_error = std::ranges::find_if(error_slots, [](const auto& error) { return error != nullptr; });
    if (first_error != error_slots.cend()) {
      std::rethrow_exception(*first_error);
    }
  }

  std::vector<Result> results;
  results.reserve(units.size());
  for (auto& slot : result_slots) {
    Assert(slot.has_value(), "The executor returned before all units were processed.");
    results.emplace_back(std::move(*slot));
  }
  return results;
}

}  // namespace seqpart
