#include "rref_core/rref_core.hpp"

#include "test_dbg.hpp"

#include <cassert>
#include <cmath>
#include <cstring>

using rref_core::ErrorCode;
using rref_core::Matrix;
using rref_core::RowOpKind;
using rref_core::RunState;
using rref_core::SolutionKind;
using rref_core::Step;
using rref_core::StepEngine;
using rref_core::StepKind;

static Matrix make(std::size_t rows, std::size_t cols, const double* v) {
		Matrix m;
		assert(Matrix::create(rows, cols, v, rows * cols, &m) == ErrorCode::Ok);
		return m;
}

static Step next(StepEngine& engine) {
		Step step;
		assert(engine.advance(&step) == ErrorCode::Ok);
		rref_test::print_step(step);
		return step;
}

int main() {
		// an engine without a matrix has nothing to do.
		{
				StepEngine engine;
				Step step;
				assert(engine.state() == RunState::NotStarted);
				assert(engine.advance(&step) == ErrorCode::InvalidDimension);
				assert(engine.step_count() == 0);
		}

		// first non-zero row below the cursor is swapped up, announced twice.
		{
				const double v[6] = {0, 1, 2, 1, 0, 3};
				StepEngine engine(make(2, 3, v));
				assert(engine.state() == RunState::NotStarted);

				Step s = next(engine);
				assert(s.kind == StepKind::PivotSearch);
				assert(engine.state() == RunState::InProgress);

				s = next(engine);
				assert(s.kind == StepKind::PivotFound);
				assert(s.swap && s.row == 1);
				assert(s.has_op && s.op.kind == RowOpKind::Swap);
				assert(std::strcmp(s.text, "Pivot found at (2, 1). Swapping R1 and R2.") == 0);
				// announced, not applied yet
				assert(engine.matrix().at(0, 0) == 0.0);

				s = next(engine);
				assert(s.kind == StepKind::SwapPerformed);
				assert(std::strcmp(s.text, "R1 and R2 swapped.") == 0);
				assert(engine.matrix().at(0, 0) == 1.0 && engine.matrix().at(1, 1) == 1.0);

				assert(next(engine).kind == StepKind::PivotAlreadyOne);
				assert(next(engine).kind == StepKind::EliminationStart);
				// row 2 is already zero in column 1, so no elimination steps
				s = next(engine);
				assert(s.kind == StepKind::ColumnComplete);
				assert(std::strcmp(s.text, "Column 1 is complete.") == 0);
				assert(engine.cursor().row == 1 && engine.cursor().col == 1);

				std::size_t rest = 0;
				assert(engine.run_to_end(&rest) == ErrorCode::Ok);
				assert(engine.step_count() == 15);
				assert(engine.classification().kind == SolutionKind::Unique);
				assert(std::strcmp(engine.last_step().text, "Analysis complete.") == 0);
		}

		// entries within epsilon of zero never qualify as pivots.
		{
				const double v[6] = {1e-12, 1, 2, 4, 1, 3};
				StepEngine engine(make(2, 3, v));
				assert(next(engine).kind == StepKind::PivotSearch);
				const Step s = next(engine);
				assert(s.kind == StepKind::PivotFound && s.swap && s.row == 1);
		}

		// scaling announces 1/v before touching the row.
		{
				const double v[4] = {4, 8, 1, 1};
				StepEngine engine(make(2, 2, v));
				next(engine);
				next(engine);
				Step s = next(engine);
				assert(s.kind == StepKind::ScaleNeeded);
				assert(s.value == 4.0 && s.op.scalar == 0.25);
				assert(std::strcmp(s.text, "Scaling R1 by 1 / 4.00 to make pivot = 1.") == 0);
				assert(engine.matrix().at(0, 0) == 4.0);

				s = next(engine);
				assert(s.kind == StepKind::ScalePerformed);
				assert(std::strcmp(s.text, "R1 scaled.") == 0);
				assert(engine.matrix().at(0, 0) == 1.0 && engine.matrix().at(0, 1) == 2.0);

				assert(next(engine).kind == StepKind::EliminationStart);
				s = next(engine);
				assert(s.kind == StepKind::EliminationRow);
				assert(s.row == 1 && s.value == 1.0);
				assert(s.op.kind == RowOpKind::AddMul && s.op.scalar == -1.0 && s.op.source_row == 0);
				assert(std::strcmp(s.text, "Eliminating in R2:  R2 = R2 - (1.00) * R1.") == 0);
				assert(engine.matrix().at(1, 0) == 1.0);

				s = next(engine);
				assert(s.kind == StepKind::EliminationRowDone);
				assert(std::strcmp(s.text, "R2 updated.") == 0);
				assert(engine.matrix().at(1, 0) == 0.0 && engine.matrix().at(1, 1) == -1.0);
		}

		// a zero column advances the column only and leaves the matrix alone.
		{
				const double v[6] = {0, 1, 5, 0, 2, 6};
				StepEngine engine(make(2, 3, v));
				const Matrix before = make(2, 3, v);

				next(engine);
				const Step s = next(engine);
				assert(s.kind == StepKind::NoPivotInColumn);
				assert(std::strcmp(s.text, "Column 1 has no pivot. Moving to next column.") == 0);
				assert(engine.cursor().row == 0 && engine.cursor().col == 1);
				assert(rref_test::matrix_equal(engine.matrix(), before.view()));

				const Step search = next(engine);
				assert(search.kind == StepKind::PivotSearch);
				assert(std::strcmp(search.text, "Finding pivot in Column 2, at or below Row 1.") == 0);
		}

		// single column: elimination runs, analysis is not applicable.
		{
				const double v[2] = {2, 4};
				StepEngine engine(make(2, 1, v));
				Step step;
				std::size_t n = 0;
				for (;;) {
						const ErrorCode ec = engine.advance(&step);
						if (ec == ErrorCode::StepOutOfRange)
								break;
						assert(ec == ErrorCode::Ok);
						assert(step.kind != StepKind::SolutionSummary);
						assert(step.kind != StepKind::UniqueSolution);
						assert(step.kind != StepKind::InfiniteSolutions);
						assert(step.kind != StepKind::NoSolution);
						assert(step.kind != StepKind::ContradictionFound);
						n++;
				}
				assert(n == 10);
				assert(step.kind == StepKind::NotApplicable);
				assert(std::strcmp(step.text, "Matrix has only one column. Solution analysis is not applicable.") == 0);
				assert(engine.classification().kind == SolutionKind::NotApplicable);
				assert(engine.matrix().at(0, 0) == 1.0 && engine.matrix().at(1, 0) == 0.0);
		}

		// exhausted engines keep answering "no more steps" without changing.
		{
				const double v[2] = {3, 6};
				StepEngine engine(make(1, 2, v));
				std::size_t n = 0;
				assert(engine.run_to_end(&n) == ErrorCode::Ok);
				assert(engine.finished());
				const std::size_t count = engine.step_count();
				const StepKind last = engine.last_step().kind;

				Step step;
				assert(engine.advance(&step) == ErrorCode::StepOutOfRange);
				assert(engine.advance(nullptr) == ErrorCode::StepOutOfRange);
				assert(engine.state() == RunState::Finished);
				assert(engine.step_count() == count && engine.last_step().kind == last);

				assert(engine.run_to_end(&n) == ErrorCode::Ok);
				assert(n == 0);
		}

		// advance(nullptr) still moves; last_step() holds what happened.
		{
				const double v[4] = {2, 4, 6, 8};
				StepEngine engine(make(2, 2, v));
				assert(engine.advance(nullptr) == ErrorCode::Ok);
				assert(engine.last_step().kind == StepKind::PivotSearch);
				assert(engine.step_count() == 1);
		}

		// reset drops the run and its matrix.
		{
				const double a[4] = {2, 4, 6, 8};
				const double b[3] = {5, 0, 1};
				StepEngine engine(make(2, 2, a));
				for (int i = 0; i < 5; i++)
						next(engine);
				assert(engine.state() == RunState::InProgress);

				engine.reset(make(1, 3, b));
				assert(engine.state() == RunState::NotStarted);
				assert(engine.step_count() == 0);
				assert(engine.cursor().row == 0 && engine.cursor().col == 0);
				assert(engine.matrix().rows == 1 && engine.matrix().cols == 3);
				assert(engine.classification().kind == SolutionKind::Unknown);

				std::size_t n = 0;
				assert(engine.run_to_end(&n) == ErrorCode::Ok);
				assert(engine.classification().kind == SolutionKind::Infinite);
				assert(engine.classification().free_variables == 1);
		}

		// fresh engines over the same input give identical runs.
		{
				const double v[12] = {2, -1, 0.3, 7, 4, 1e-3, -5, 1, 0.5, 9, 3, -2};
				StepEngine first(make(3, 4, v));
				StepEngine second(make(3, 4, v));
				Step a;
				Step b;
				for (;;) {
						const ErrorCode ea = first.advance(&a);
						const ErrorCode eb = second.advance(&b);
						assert(ea == eb);
						if (ea != ErrorCode::Ok)
								break;
						assert(a.kind == b.kind);
						assert(std::strcmp(a.text, b.text) == 0);
						assert(rref_test::matrix_equal(first.matrix(), second.matrix()));
				}
				assert(first.step_count() == second.step_count());
				assert(first.classification().kind == SolutionKind::Unique);
		}

		// entries near DBL_MAX overflow to inf, and inf - inf leaves a NaN.
		// a NaN is neither a pivot candidate nor a nonzero constant.
		{
				const double v[9] = {1, 0, 1e308, -2, 1, 0, -2, 1, 0};
				StepEngine engine(make(3, 3, v));
				for (int i = 0; i < 9; i++)
						next(engine);
				assert(engine.last_step().kind == StepKind::ColumnComplete);
				assert(std::isinf(engine.matrix().at(1, 2)) && std::isinf(engine.matrix().at(2, 2)));

				for (int i = 0; i < 7; i++)
						next(engine);
				assert(engine.last_step().kind == StepKind::ColumnComplete);
				assert(std::isnan(engine.matrix().at(2, 2)));

				Step s = next(engine);
				assert(std::strcmp(s.text, "Finding pivot in Column 3, at or below Row 3.") == 0);
				s = next(engine);
				assert(s.kind == StepKind::NoPivotInColumn);
				assert(std::strcmp(s.text, "Column 3 has no pivot. Moving to next column.") == 0);
				assert(next(engine).kind == StepKind::Complete);

				s = next(engine);
				assert(s.kind == StepKind::SolutionSummary);
				assert(std::strcmp(s.text, "Analysis found 2 pivot(s) for 2 variable(s).") == 0);
				assert(next(engine).kind == StepKind::UniqueSolution);
				assert(next(engine).kind == StepKind::AnalysisComplete);
				assert(engine.advance(nullptr) == ErrorCode::StepOutOfRange);
				assert(engine.step_count() == 22);
				assert(engine.classification().kind == SolutionKind::Unique);
				assert(engine.classification().pivots == 2);
		}

		// every step kind has a name.
		assert(std::strcmp(rref_core::step_kind_name(StepKind::EliminationRowDone), "EliminationRowDone") == 0);
		assert(std::strcmp(rref_core::step_kind_name(StepKind::NotApplicable), "NotApplicable") == 0);

		return 0;
}
