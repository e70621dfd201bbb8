#include <gtest/gtest.h>

#include <algorithm>
#include <armadillo>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include "relevance_regression.hpp"

using namespace sparse_rvr;

namespace {

FitOptions QuietOptions(bool bias_used) {
  FitOptions options;
  options.bias_used = bias_used;
  options.verbose = false;
  return options;
}

// y = 3 * x1 + noise, with x2 unrelated to y.
struct LinearData {
  arma::mat basis;
  arma::vec targets;
};

LinearData MakeLinearData(arma::uword n, double noise, bool with_bias) {
  arma::arma_rng::set_seed(1234);
  arma::vec x1 = arma::randn<arma::vec>(n);
  arma::vec x2 = arma::randn<arma::vec>(n);
  LinearData data;
  data.targets = 3.0 * x1 + noise * arma::randn<arma::vec>(n);
  if (with_bias) {
    data.targets += 1.5;
    data.basis = arma::join_rows(x1, x2, arma::ones<arma::vec>(n));
  } else {
    data.basis = arma::join_rows(x1, x2);
  }
  return data;
}

double WeightOf(const RelevanceVectorRegression& model,
                const std::string& label, bool* present) {
  const std::vector<std::string>& labels = model.labels();
  auto it = std::find(labels.begin(), labels.end(), label);
  *present = it != labels.end();
  if (!*present) {
    return 0.0;
  }
  return model.mean()(static_cast<arma::uword>(it - labels.begin()));
}

}  // namespace

TEST(RegressionTest, RecoversRelevantWeight) {
  LinearData data = MakeLinearData(100, 0.1, false);
  RelevanceVectorRegression model(QuietOptions(false));

  model.Fit(data.basis, data.targets, {"x1", "x2"});

  bool has_x1 = false;
  bool has_x2 = false;
  double w1 = WeightOf(model, "x1", &has_x1);
  double w2 = WeightOf(model, "x2", &has_x2);
  ASSERT_TRUE(has_x1);
  EXPECT_NEAR(w1, 3.0, 0.2);
  if (has_x2) {
    EXPECT_LT(std::abs(w2), 0.1);
  }
  EXPECT_FALSE(model.bias().has_value());
  EXPECT_TRUE(model.is_fitted());
  EXPECT_NE(model.status(), FitStatus::kSingular);
}

TEST(RegressionTest, RecoversIntercept) {
  LinearData data = MakeLinearData(100, 0.1, true);
  RelevanceVectorRegression model(QuietOptions(true));

  model.Fit(data.basis, data.targets, {"x1", "x2"});

  ASSERT_TRUE(model.bias_used());
  ASSERT_TRUE(model.bias().has_value());
  EXPECT_NEAR(*model.bias(), 1.5, 0.2);
  EXPECT_DOUBLE_EQ(*model.bias(), model.mean()(model.mean().n_elem - 1));
  EXPECT_EQ(model.relevant_idx()(model.relevant_idx().n_elem - 1), 2u);
  EXPECT_EQ(model.labels().size() + 1, model.mean().n_elem);
}

TEST(RegressionTest, StateSizesAgreeEveryIteration) {
  LinearData data = MakeLinearData(80, 0.5, true);
  FitOptions options = QuietOptions(true);
  options.verbose = true;
  options.verb_freq = 1;

  std::vector<FitDiagnostic> events;
  RelevanceVectorRegression model(
      options, [&events](const FitDiagnostic& d) { events.push_back(d); });
  model.Fit(data.basis, data.targets, {"x1", "x2"});

  int n_iteration_events = 0;
  for (const FitDiagnostic& d : events) {
    if (d.event != FitEvent::kIteration) {
      continue;
    }
    ++n_iteration_events;
    EXPECT_EQ(d.alpha.n_elem, d.n_relevant);
    EXPECT_EQ(d.mean.n_elem, d.n_relevant);
    EXPECT_EQ(d.gamma.n_elem, d.n_relevant);
    EXPECT_GT(d.beta, 0.0);
  }
  EXPECT_EQ(n_iteration_events, model.n_iter());

  const arma::mat& sigma = model.covariance();
  EXPECT_EQ(sigma.n_rows, model.mean().n_elem);
  EXPECT_EQ(sigma.n_cols, model.mean().n_elem);
  EXPECT_EQ(model.alpha().n_elem, model.mean().n_elem);
  EXPECT_EQ(model.gamma().n_elem, model.mean().n_elem);
  EXPECT_EQ(model.relevant_idx().n_elem, model.mean().n_elem);
  EXPECT_TRUE(arma::approx_equal(sigma, sigma.t(), "absdiff", 1e-12));
}

TEST(RegressionTest, RelevanceSetNeverGrows) {
  LinearData data = MakeLinearData(60, 0.3, true);
  RelevanceVectorRegression model(QuietOptions(true));

  model.Fit(data.basis, data.targets);

  const arma::uvec& trace = model.relevance_trace();
  ASSERT_EQ(trace.n_elem, static_cast<arma::uword>(model.n_iter()));
  ASSERT_GT(trace.n_elem, 0u);
  EXPECT_LE(trace(0), 3u);
  for (arma::uword i = 1; i < trace.n_elem; ++i) {
    EXPECT_LE(trace(i), trace(i - 1));
  }
  EXPECT_GE(trace(trace.n_elem - 1), 1u);
  EXPECT_EQ(model.log_marginal_likelihood_trace().n_elem, trace.n_elem);
}

TEST(RegressionTest, ConvergedFitStopsEarly) {
  LinearData data = MakeLinearData(100, 0.1, false);
  RelevanceVectorRegression model(QuietOptions(false));

  model.Fit(data.basis, data.targets, {"x1", "x2"});

  EXPECT_EQ(model.status(), FitStatus::kConverged);
  EXPECT_LT(model.n_iter(), model.options().n_iter);
  EXPECT_GE(model.n_iter(), 3);
}

TEST(RegressionTest, IterationBudgetIsNotAnError) {
  LinearData data = MakeLinearData(50, 0.1, false);
  FitOptions options = QuietOptions(false);
  options.n_iter = 2;

  RelevanceVectorRegression model(options);
  model.Fit(data.basis, data.targets);

  EXPECT_EQ(model.status(), FitStatus::kMaxIterations);
  EXPECT_EQ(model.n_iter(), 2);
  EXPECT_TRUE(model.is_fitted());
}

TEST(RegressionTest, EmitsExhaustedEvent) {
  LinearData data = MakeLinearData(50, 0.1, false);
  FitOptions options = QuietOptions(false);
  options.n_iter = 2;
  options.verbose = true;
  options.verb_freq = 100;

  std::vector<FitEvent> kinds;
  RelevanceVectorRegression model(
      options, [&kinds](const FitDiagnostic& d) { kinds.push_back(d.event); });
  model.Fit(data.basis, data.targets);

  ASSERT_FALSE(kinds.empty());
  EXPECT_EQ(kinds.back(), FitEvent::kExhausted);
  EXPECT_EQ(std::count(kinds.begin(), kinds.end(), FitEvent::kIteration), 0);
}

TEST(RegressionTest, PredictionReproducesLowNoiseTargets) {
  arma::arma_rng::set_seed(99);
  const arma::uword n = 100;
  arma::vec x1 = arma::randn<arma::vec>(n);
  arma::vec x2 = arma::randn<arma::vec>(n);
  arma::vec y = 2.0 * x1 - 1.0 * x2 + 0.5 + 0.01 * arma::randn<arma::vec>(n);
  arma::mat basis = arma::join_rows(x1, x2, arma::ones<arma::vec>(n));

  RelevanceVectorRegression model(QuietOptions(true));
  model.Fit(basis, y, {"x1", "x2"});

  arma::mat relevant = model.SelectRelevant(basis);
  arma::vec variance;
  arma::vec prediction = model.Predict(relevant, variance);

  ASSERT_EQ(prediction.n_elem, n);
  ASSERT_EQ(variance.n_elem, n);
  EXPECT_LT(arma::max(arma::abs(prediction - y)), 0.06);
  for (arma::uword i = 0; i < n; ++i) {
    EXPECT_GE(variance(i) + 1e-12, 1.0 / model.beta());
  }
  EXPECT_TRUE(arma::approx_equal(model.Predict(relevant), prediction,
                                 "absdiff", 1e-12));
}

TEST(RegressionTest, DegenerateThresholdKeepsForcedSet) {
  LinearData data = MakeLinearData(50, 0.1, true);
  FitOptions options = QuietOptions(true);
  options.threshold_alpha = 1e-12;
  options.n_iter = 20;

  RelevanceVectorRegression model(options);
  model.Fit(data.basis, data.targets, {"x1", "x2"});

  ASSERT_EQ(model.relevant_idx().n_elem, 2u);
  EXPECT_EQ(model.relevant_idx()(0), 0u);
  EXPECT_EQ(model.relevant_idx()(1), 2u);
  EXPECT_TRUE(model.bias_used());
  ASSERT_EQ(model.labels().size(), 1u);
  EXPECT_EQ(model.labels()[0], "x1");
}

TEST(RegressionTest, DegenerateThresholdWithoutBias) {
  LinearData data = MakeLinearData(50, 0.1, false);
  FitOptions options = QuietOptions(false);
  options.threshold_alpha = 1e-12;
  options.n_iter = 20;

  RelevanceVectorRegression model(options);
  model.Fit(data.basis, data.targets, {"x1", "x2"});

  ASSERT_EQ(model.relevant_idx().n_elem, 1u);
  EXPECT_EQ(model.relevant_idx()(0), 0u);
  EXPECT_FALSE(model.bias().has_value());
}

TEST(RegressionTest, ZeroColumnIsPrunedImmediately) {
  arma::arma_rng::set_seed(21);
  const arma::uword n = 40;
  arma::vec x1 = arma::randn<arma::vec>(n);
  arma::mat basis = arma::join_rows(x1, arma::zeros<arma::vec>(n));
  arma::vec y = 3.0 * x1 + 0.1 * arma::randn<arma::vec>(n);

  FitOptions options = QuietOptions(false);
  options.verbose = true;
  options.verb_freq = 1000;
  std::vector<FitDiagnostic> pruned;
  RelevanceVectorRegression model(options, [&pruned](const FitDiagnostic& d) {
    if (d.event == FitEvent::kPruned) {
      pruned.push_back(d);
    }
  });
  model.Fit(basis, y, {"x1", "zero"});

  ASSERT_GE(model.relevance_trace().n_elem, 1u);
  EXPECT_EQ(model.relevance_trace()(0), 1u);
  ASSERT_EQ(pruned.size(), 1u);
  EXPECT_EQ(pruned[0].iteration, 0);
  ASSERT_EQ(pruned[0].pruned_labels.size(), 1u);
  EXPECT_EQ(pruned[0].pruned_labels[0], "zero");
  EXPECT_TRUE(model.alpha().is_finite());
}

TEST(RegressionTest, FixedBetaIsNotReestimated) {
  LinearData data = MakeLinearData(60, 0.1, false);
  FitOptions options = QuietOptions(false);
  options.beta = 100.0;
  options.beta_fixed = true;

  RelevanceVectorRegression model(options);
  model.Fit(data.basis, data.targets);

  EXPECT_DOUBLE_EQ(model.beta(), 100.0);
}

TEST(RegressionTest, GeneratesLabelsWhenNoneGiven) {
  LinearData data = MakeLinearData(30, 0.1, true);
  FitOptions options = QuietOptions(true);
  options.n_iter = 1;

  RelevanceVectorRegression model(options);
  model.Fit(data.basis, data.targets);

  ASSERT_EQ(model.labels().size(), 2u);
  EXPECT_EQ(model.labels()[0], "phi_0");
  EXPECT_EQ(model.labels()[1], "phi_1");
}

TEST(RegressionTest, RejectsMismatchedRows) {
  RelevanceVectorRegression model(QuietOptions(false));
  arma::mat basis = arma::randn<arma::mat>(10, 2);
  arma::vec y = arma::randn<arma::vec>(9);

  EXPECT_THROW(model.Fit(basis, y), ShapeMismatchError);
  EXPECT_FALSE(model.is_fitted());
}

TEST(RegressionTest, RejectsWrongLabelCount) {
  arma::mat basis = arma::randn<arma::mat>(10, 3);
  arma::vec y = arma::randn<arma::vec>(10);

  RelevanceVectorRegression with_bias(QuietOptions(true));
  EXPECT_THROW(with_bias.Fit(basis, y, {"a", "b", "c"}), ShapeMismatchError);
  EXPECT_NO_THROW(with_bias.Fit(basis, y, {"a", "b"}));

  RelevanceVectorRegression without_bias(QuietOptions(false));
  EXPECT_THROW(without_bias.Fit(basis, y, {"a", "b"}), ShapeMismatchError);
}

TEST(RegressionTest, RejectsEmptyBasis) {
  RelevanceVectorRegression model(QuietOptions(false));
  EXPECT_THROW(model.Fit(arma::mat(), arma::vec()), ShapeMismatchError);
}

TEST(RegressionTest, RejectsNonFiniteInput) {
  RelevanceVectorRegression model(QuietOptions(false));
  arma::mat basis = arma::randn<arma::mat>(5, 2);
  basis(2, 1) = arma::datum::nan;

  EXPECT_THROW(model.Fit(basis, arma::randn<arma::vec>(5)),
               std::invalid_argument);
}

TEST(RegressionTest, RejectsInvalidOptions) {
  FitOptions options = QuietOptions(false);
  options.tol = 0.0;
  EXPECT_THROW(RelevanceVectorRegression{options}, std::invalid_argument);

  options = QuietOptions(false);
  options.n_iter = 0;
  EXPECT_THROW(RelevanceVectorRegression{options}, std::invalid_argument);

  options = QuietOptions(false);
  options.beta = -1.0;
  EXPECT_THROW(RelevanceVectorRegression{options}, std::invalid_argument);

  options = QuietOptions(false);
  options.verb_freq = 0;
  EXPECT_THROW(RelevanceVectorRegression{options}, std::invalid_argument);
}

TEST(RegressionTest, PredictBeforeFitThrows) {
  RelevanceVectorRegression model(QuietOptions(false));
  arma::mat basis = arma::ones<arma::mat>(3, 1);
  arma::vec variance;

  EXPECT_THROW(model.Predict(basis), UnfittedModelError);
  EXPECT_THROW(model.Predict(basis, variance), UnfittedModelError);
  EXPECT_THROW(model.SelectRelevant(basis), UnfittedModelError);
}

TEST(RegressionTest, PredictRejectsWrongWidth) {
  LinearData data = MakeLinearData(50, 0.1, true);
  RelevanceVectorRegression model(QuietOptions(true));
  model.Fit(data.basis, data.targets);

  arma::mat wide = arma::ones<arma::mat>(4, model.mean().n_elem + 1);
  EXPECT_THROW(model.Predict(wide), ShapeMismatchError);
  EXPECT_THROW(model.SelectRelevant(arma::ones<arma::mat>(4, 5)),
               ShapeMismatchError);
}

TEST(RegressionTest, OverflowingBasisIsSingular) {
  arma::mat basis = 1e200 * arma::ones<arma::mat>(6, 2);
  basis(0, 1) = -1e200;
  arma::vec y = arma::ones<arma::vec>(6);

  RelevanceVectorRegression model(QuietOptions(false));

  EXPECT_THROW(model.Fit(basis, y), SingularSystemError);
  EXPECT_FALSE(model.is_fitted());
}

TEST(RegressionTest, VerboseWithoutSinkPrintsProgress) {
  LinearData data = MakeLinearData(50, 0.1, false);
  FitOptions options = QuietOptions(false);
  options.verbose = true;
  options.verb_freq = 1;
  options.n_iter = 3;

  RelevanceVectorRegression model(options);
  testing::internal::CaptureStdout();
  model.Fit(data.basis, data.targets, {"x1", "x2"});
  std::string output = testing::internal::GetCapturedStdout();

  EXPECT_NE(output.find("Fit @ iteration 0:"), std::string::npos);
  EXPECT_NE(output.find("--Relevance Vectors"), std::string::npos);
}

TEST(RegressionTest, SingularSolveMidFitKeepsLastValidState) {
  // The first solve is fine; the re-estimated noise precision then makes
  // beta * Phi'Phi overflow on the second iteration.
  arma::arma_rng::set_seed(17);
  const arma::uword n = 20;
  arma::mat basis = 1e150 * arma::randn<arma::mat>(n, 2);
  arma::vec y = 1e-150 * basis.col(0) - 2e-150 * basis.col(1) +
                1e-6 * arma::randn<arma::vec>(n);

  FitOptions options = QuietOptions(false);
  options.verbose = true;
  options.verb_freq = 1;
  std::vector<FitDiagnostic> iterations;
  RelevanceVectorRegression model(
      options, [&iterations](const FitDiagnostic& d) {
        if (d.event == FitEvent::kIteration) {
          iterations.push_back(d);
        }
      });

  EXPECT_THROW(model.Fit(basis, y, {"x1", "x2"}), SingularSystemError);

  ASSERT_EQ(iterations.size(), 1u);
  ASSERT_TRUE(model.is_fitted());
  EXPECT_EQ(model.status(), FitStatus::kSingular);
  EXPECT_EQ(model.n_iter(), 1);

  const arma::uword k = model.mean().n_elem;
  ASSERT_GE(k, 1u);
  EXPECT_EQ(model.alpha().n_elem, k);
  EXPECT_EQ(model.gamma().n_elem, k);
  EXPECT_EQ(model.covariance().n_rows, k);
  EXPECT_EQ(model.covariance().n_cols, k);
  EXPECT_EQ(model.relevant_idx().n_elem, k);
  EXPECT_EQ(model.labels().size(), k);
  EXPECT_TRUE(model.alpha().is_finite());
  EXPECT_GT(model.beta(), 0.0);

  arma::vec variance;
  arma::vec prediction = model.Predict(model.SelectRelevant(basis), variance);
  ASSERT_EQ(prediction.n_elem, n);
  EXPECT_TRUE(prediction.is_finite());
  EXPECT_TRUE(variance.is_finite());
}
