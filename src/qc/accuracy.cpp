#include "bsa/qc/accuracy.hpp"
#include "bsa/pricing/analytic_bs.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <utility>

namespace {

using bsa::market::OptionKind;

inline bool valid_kind(OptionKind k) {
  return k == OptionKind::Call || k == OptionKind::Put;
}

inline std::optional<double> defined_if_finite(double x) {
  if (std::isfinite(x)) return x;
  return std::nullopt;
}

// Bornes [begin,end) du bloc i sur n éléments répartis en `parts` blocs contigus.
inline std::pair<std::size_t, std::size_t> chunk(std::size_t i, std::size_t parts, std::size_t n) {
  const std::size_t step = (n + parts - 1) / parts;
  const std::size_t b = std::min(n, i * step);
  const std::size_t e = std::min(n, b + step);
  return {b, e};
}

inline std::size_t effective_threads(std::size_t n_threads, std::size_t n) {
  return std::max<std::size_t>(1, std::min(n_threads, n));
}

} // namespace

namespace bsa::qc {

// --- AccuracySummary ------------------------------------------------------------

std::size_t AccuracySummary::failures_for(core::FailureReason reason) const noexcept {
  return failures[static_cast<std::size_t>(reason)];
}

std::size_t AccuracySummary::count_by_kind(market::OptionKind kind) const {
  return by_kind(kind).count;
}

const SubsetSummary& AccuracySummary::by_kind(market::OptionKind kind) const {
  if (!valid_kind(kind)) {
    throw core::InvalidOptionKind("AccuracySummary: option kind is neither call nor put");
  }
  return kind == OptionKind::Call ? call : put;
}

// --- Subset ---------------------------------------------------------------------

void AccuracyAccumulator::Subset::add(const metrics::ErrorSample& sample) {
  ++count;
  if (!sample.percentage_error || !sample.absolute_percentage_error) return;
  signed_pct.add(*sample.percentage_error);
  abs_pct.add(*sample.absolute_percentage_error);
  abs_values.push_back(*sample.absolute_percentage_error);
}

void AccuracyAccumulator::Subset::merge(const Subset& other) {
  count  += other.count;
  failed += other.failed;
  signed_pct.merge(other.signed_pct);
  abs_pct.merge(other.abs_pct);
  abs_values.insert(abs_values.end(), other.abs_values.begin(), other.abs_values.end());
}

SubsetSummary AccuracyAccumulator::Subset::summary() const {
  SubsetSummary s;
  s.count         = count;
  s.count_defined = abs_values.size();
  s.count_failed  = failed;
  if (s.count_defined == 0) return s; // tout reste indéfini

  s.mean_absolute_pct_error   = defined_if_finite(abs_pct.mean());
  s.median_absolute_pct_error = defined_if_finite(core::median(abs_values));
  s.mean_signed_pct_error     = defined_if_finite(signed_pct.mean());
  s.stddev_signed_pct_error   = defined_if_finite(signed_pct.stddev()); // NaN si n<2
  return s;
}

// --- AccuracyAccumulator ----------------------------------------------------------

AccuracyAccumulator::Subset& AccuracyAccumulator::subset(market::OptionKind kind) {
  if (!valid_kind(kind)) {
    throw core::InvalidOptionKind("AccuracyAccumulator: option kind is neither call nor put");
  }
  return kind == OptionKind::Call ? call_ : put_;
}

void AccuracyAccumulator::add(const metrics::ErrorSample& sample, market::OptionKind kind) {
  Subset& by_kind = subset(kind); // lève avant toute mise à jour
  ++total_;
  ++succeeded_;
  overall_.add(sample);
  by_kind.add(sample);
}

void AccuracyAccumulator::add_failure(core::FailureReason reason,
                                      std::optional<market::OptionKind> kind) {
  ++total_;
  ++failures_[static_cast<std::size_t>(reason)];
  ++overall_.count;
  ++overall_.failed;
  if (kind && valid_kind(*kind)) {
    Subset& s = subset(*kind);
    ++s.count;
    ++s.failed;
  }
}

void AccuracyAccumulator::add(const EvaluatedRow& row) {
  if (row.sample) {
    add(*row.sample, row.quote.kind);
    return;
  }
  const auto reason = row.failure.value_or(core::FailureReason::InvalidInput);
  std::optional<market::OptionKind> kind;
  if (valid_kind(row.quote.kind)) kind = row.quote.kind;
  add_failure(reason, kind);
}

void AccuracyAccumulator::merge(const AccuracyAccumulator& other) {
  total_     += other.total_;
  succeeded_ += other.succeeded_;
  for (std::size_t i = 0; i < failures_.size(); ++i) failures_[i] += other.failures_[i];
  overall_.merge(other.overall_);
  call_.merge(other.call_);
  put_.merge(other.put_);
}

AccuracySummary AccuracyAccumulator::summary() const {
  AccuracySummary s;
  s.count_total     = total_;
  s.count_succeeded = succeeded_;
  s.failures        = failures_;
  s.overall         = overall_.summary();
  s.call            = call_.summary();
  s.put             = put_.summary();
  return s;
}

// --- Pipeline -------------------------------------------------------------------

EvaluatedRow evaluate_one(const market::OptionQuote& quote) {
  EvaluatedRow row;
  row.quote = quote;
  try {
    const double theo = pricing::price(quote);
    row.theoretical_price = theo;
    row.sample = metrics::compute_error(theo, quote.observed_price);
  } catch (const core::PricingError& e) {
    row.sample.reset();
    row.failure = e.reason();
    row.failure_message = e.what();
  }
  return row;
}

std::vector<EvaluatedRow> evaluate(const std::vector<market::OptionQuote>& quotes) {
  std::vector<EvaluatedRow> out;
  out.reserve(quotes.size());
  for (const auto& q : quotes) out.push_back(evaluate_one(q));
  return out;
}

std::vector<EvaluatedRow> evaluate_parallel(const std::vector<market::OptionQuote>& quotes,
                                            std::size_t n_threads) {
  const std::size_t n = quotes.size();
  const std::size_t parts = effective_threads(n_threads, n);
  if (parts <= 1) return evaluate(quotes);

  std::vector<EvaluatedRow> out(n);
  std::vector<std::future<void>> jobs;
  jobs.reserve(parts);
  for (std::size_t i = 0; i < parts; ++i) {
    const auto [b, e] = chunk(i, parts, n);
    jobs.push_back(std::async(std::launch::async, [&quotes, &out, b = b, e = e] {
      for (std::size_t k = b; k < e; ++k) out[k] = evaluate_one(quotes[k]);
    }));
  }
  for (auto& j : jobs) j.get(); // propage une éventuelle exception du worker
  return out;
}

AccuracySummary summarize(const std::vector<KindedSample>& samples) {
  AccuracyAccumulator acc;
  for (const auto& s : samples) acc.add(s.sample, s.kind);
  return acc.summary();
}

AccuracySummary summarize(const std::vector<EvaluatedRow>& rows) {
  AccuracyAccumulator acc;
  for (const auto& r : rows) acc.add(r);
  return acc.summary();
}

AccuracySummary summarize_parallel(const std::vector<EvaluatedRow>& rows,
                                   std::size_t n_threads) {
  const std::size_t n = rows.size();
  const std::size_t parts = effective_threads(n_threads, n);
  if (parts <= 1) return summarize(rows);

  std::vector<std::future<AccuracyAccumulator>> jobs;
  jobs.reserve(parts);
  for (std::size_t i = 0; i < parts; ++i) {
    const auto [b, e] = chunk(i, parts, n);
    jobs.push_back(std::async(std::launch::async, [&rows, b = b, e = e] {
      AccuracyAccumulator part;
      for (std::size_t k = b; k < e; ++k) part.add(rows[k]);
      return part;
    }));
  }

  AccuracyAccumulator acc;
  for (auto& j : jobs) acc.merge(j.get()); // ordre des blocs = ordre d'entrée
  return acc.summary();
}

} // namespace bsa::qc
