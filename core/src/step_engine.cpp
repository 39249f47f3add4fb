#include "rref_core/step_engine.hpp"

namespace rref_core {

void StepEngine::reset(const Matrix& m) noexcept {
		matrix_ = m;
		state_ = RunState::NotStarted;
		resume_ = Resume::LoopHead;
		cursor_ = {};
		pivot_row_ = 0;
		elim_row_ = 0;
		pending_ = 0.0;
		last_ = Step{};
		steps_ = 0;
		result_ = Classification{};
}

ErrorCode StepEngine::advance(Step* out) noexcept {
		if (matrix_.empty())
				return ErrorCode::InvalidDimension;

		switch (resume_) {
		case Resume::LoopHead:
				return on_loop_head(out);
		case Resume::Search:
				return on_search(out);
		case Resume::Swap:
				return on_swap(out);
		case Resume::Normalize:
				return on_normalize(out);
		case Resume::Scale:
				return on_scale(out);
		case Resume::EliminateStart:
				return on_eliminate_start(out);
		case Resume::EliminateScan:
				return on_eliminate_scan(out);
		case Resume::EliminateApply:
				return on_eliminate_apply(out);
		case Resume::Classify:
				return on_classify(out);
		case Resume::Verdict:
				return on_verdict(out);
		case Resume::NoSolution:
				return on_final(StepKind::NoSolution, out);
		case Resume::AnalysisDone:
				return on_final(StepKind::AnalysisComplete, out);
		case Resume::Done:
				return ErrorCode::StepOutOfRange;
		}
		return ErrorCode::Internal;
}

ErrorCode StepEngine::run_to_end(std::size_t* count) noexcept {
		std::size_t n = 0;
		for (;;) {
				const ErrorCode ec = advance(nullptr);
				if (ec == ErrorCode::StepOutOfRange)
						break;
				if (!is_ok(ec))
						return ec;
				n++;
		}
		if (count)
				*count = n;
		return ErrorCode::Ok;
}

Step StepEngine::begin_step(StepKind kind) const noexcept {
		Step step;
		step.kind = kind;
		step.cursor = cursor_;
		return step;
}

ErrorCode StepEngine::render(Step& step) const noexcept {
		return step_caption(step, step.text, sizeof(step.text));
}

void StepEngine::commit(const Step& step, Resume next, Step* out) noexcept {
		last_ = step;
		steps_++;
		resume_ = next;
		state_ = (next == Resume::Done) ? RunState::Finished : RunState::InProgress;
		if (out)
				*out = step;
}

// phase A

ErrorCode StepEngine::on_loop_head(Step* out) noexcept {
		const bool more = cursor_.row < matrix_.rows() && cursor_.col < matrix_.cols();
		Step step = begin_step(more ? StepKind::PivotSearch : StepKind::Complete);
		ErrorCode ec = render(step);
		if (!is_ok(ec))
				return ec;
		commit(step, more ? Resume::Search : Resume::Classify, out);
		return ErrorCode::Ok;
}

ErrorCode StepEngine::on_search(Step* out) noexcept {
		// first row at or below the cursor wins, no magnitude pivoting
		bool found = false;
		std::uint8_t pivot = cursor_.row;
		for (std::uint8_t row = cursor_.row; row < matrix_.rows(); row++) {
				if (exceeds_epsilon(matrix_.at(row, cursor_.col))) {
						pivot = row;
						found = true;
						break;
				}
		}

		if (!found) {
				Step step = begin_step(StepKind::NoPivotInColumn);
				ErrorCode ec = render(step);
				if (!is_ok(ec))
						return ec;
				commit(step, Resume::LoopHead, out);
				cursor_.col++;
				return ErrorCode::Ok;
		}

		Step step = begin_step(StepKind::PivotFound);
		step.row = pivot;
		step.swap = pivot != cursor_.row;
		if (step.swap) {
				step.has_op = true;
				step.op.kind = RowOpKind::Swap;
				step.op.target_row = cursor_.row;
				step.op.source_row = pivot;
		}
		ErrorCode ec = render(step);
		if (!is_ok(ec))
				return ec;
		pivot_row_ = pivot;
		commit(step, step.swap ? Resume::Swap : Resume::Normalize, out);
		return ErrorCode::Ok;
}

ErrorCode StepEngine::on_swap(Step* out) noexcept {
		Step step = begin_step(StepKind::SwapPerformed);
		step.row = pivot_row_;
		step.has_op = true;
		step.op.kind = RowOpKind::Swap;
		step.op.target_row = cursor_.row;
		step.op.source_row = pivot_row_;
		ErrorCode ec = render(step);
		if (!is_ok(ec))
				return ec;
		ec = row_op_apply(matrix_, step.op);
		if (!is_ok(ec))
				return ec;
		commit(step, Resume::Normalize, out);
		return ErrorCode::Ok;
}

ErrorCode StepEngine::on_normalize(Step* out) noexcept {
		const double pivot = matrix_.at(cursor_.row, cursor_.col);
		if (!differs_from_one(pivot)) {
				Step step = begin_step(StepKind::PivotAlreadyOne);
				step.value = pivot;
				ErrorCode ec = render(step);
				if (!is_ok(ec))
						return ec;
				commit(step, Resume::EliminateStart, out);
				return ErrorCode::Ok;
		}

		Step step = begin_step(StepKind::ScaleNeeded);
		step.value = pivot;
		step.has_op = true;
		step.op.kind = RowOpKind::Scale;
		step.op.target_row = cursor_.row;
		step.op.scalar = 1.0 / pivot;
		ErrorCode ec = render(step);
		if (!is_ok(ec))
				return ec;
		pending_ = step.op.scalar;
		commit(step, Resume::Scale, out);
		return ErrorCode::Ok;
}

ErrorCode StepEngine::on_scale(Step* out) noexcept {
		Step step = begin_step(StepKind::ScalePerformed);
		step.value = last_.value;
		step.has_op = true;
		step.op.kind = RowOpKind::Scale;
		step.op.target_row = cursor_.row;
		step.op.scalar = pending_;
		ErrorCode ec = render(step);
		if (!is_ok(ec))
				return ec;
		ec = row_op_apply(matrix_, step.op);
		if (!is_ok(ec))
				return ec;
		commit(step, Resume::EliminateStart, out);
		return ErrorCode::Ok;
}

ErrorCode StepEngine::on_eliminate_start(Step* out) noexcept {
		Step step = begin_step(StepKind::EliminationStart);
		ErrorCode ec = render(step);
		if (!is_ok(ec))
				return ec;
		elim_row_ = 0;
		commit(step, Resume::EliminateScan, out);
		return ErrorCode::Ok;
}

ErrorCode StepEngine::on_eliminate_scan(Step* out) noexcept {
		// rows already zero in the pivot column are skipped without a step
		for (std::uint8_t row = elim_row_; row < matrix_.rows(); row++) {
				if (row == cursor_.row)
						continue;
				const double entry = matrix_.at(row, cursor_.col);
				if (!exceeds_epsilon(entry))
						continue;

				Step step = begin_step(StepKind::EliminationRow);
				step.row = row;
				step.value = entry;
				step.has_op = true;
				step.op.kind = RowOpKind::AddMul;
				step.op.target_row = row;
				step.op.source_row = cursor_.row;
				step.op.scalar = -entry;
				ErrorCode ec = render(step);
				if (!is_ok(ec))
						return ec;
				elim_row_ = row;
				pending_ = step.op.scalar;
				commit(step, Resume::EliminateApply, out);
				return ErrorCode::Ok;
		}

		Step step = begin_step(StepKind::ColumnComplete);
		ErrorCode ec = render(step);
		if (!is_ok(ec))
				return ec;
		commit(step, Resume::LoopHead, out);
		cursor_.row++;
		cursor_.col++;
		return ErrorCode::Ok;
}

ErrorCode StepEngine::on_eliminate_apply(Step* out) noexcept {
		Step step = begin_step(StepKind::EliminationRowDone);
		step.row = elim_row_;
		step.value = -pending_;
		step.has_op = true;
		step.op.kind = RowOpKind::AddMul;
		step.op.target_row = elim_row_;
		step.op.source_row = cursor_.row;
		step.op.scalar = pending_;
		ErrorCode ec = render(step);
		if (!is_ok(ec))
				return ec;
		ec = row_op_apply(matrix_, step.op);
		if (!is_ok(ec))
				return ec;
		elim_row_++;
		commit(step, Resume::EliminateScan, out);
		return ErrorCode::Ok;
}

// phase B

bool StepEngine::find_contradiction(std::uint8_t* row) const noexcept {
		const std::uint8_t last = static_cast<std::uint8_t>(matrix_.cols() - 1u);
		// every row, not just the pivot rows
		for (std::uint8_t r = 0; r < matrix_.rows(); r++) {
				bool zero_coeffs = true;
				for (std::uint8_t c = 0; c < last; c++) {
						if (exceeds_epsilon(matrix_.at(r, c))) {
								zero_coeffs = false;
								break;
						}
				}
				if (zero_coeffs && exceeds_epsilon(matrix_.at(r, last))) {
						*row = r;
						return true;
				}
		}
		return false;
}

ErrorCode StepEngine::on_classify(Step* out) noexcept {
		if (matrix_.cols() <= 1) {
				Step step = begin_step(StepKind::NotApplicable);
				ErrorCode ec = render(step);
				if (!is_ok(ec))
						return ec;
				result_.kind = SolutionKind::NotApplicable;
				commit(step, Resume::Done, out);
				return ErrorCode::Ok;
		}

		// cursor.row is the number of pivot rows reached, i.e. the rank
		Classification result;
		result.variables = static_cast<std::uint8_t>(matrix_.cols() - 1u);
		result.pivots = cursor_.row;

		std::uint8_t bad_row = 0;
		if (find_contradiction(&bad_row)) {
				Step step = begin_step(StepKind::ContradictionFound);
				step.row = bad_row;
				step.value = matrix_.at(bad_row, result.variables);
				ErrorCode ec = render(step);
				if (!is_ok(ec))
						return ec;
				result.kind = SolutionKind::NoSolution;
				result.contradiction_row = bad_row;
				result_ = result;
				commit(step, Resume::NoSolution, out);
				return ErrorCode::Ok;
		}

		// a pivot in the constant column always leaves a [0 ... 0 | 1] row,
		// so past this point pivots <= variables
		if (result.pivots < result.variables) {
				result.kind = SolutionKind::Infinite;
				result.free_variables = static_cast<std::uint8_t>(result.variables - result.pivots);
		} else {
				result.kind = SolutionKind::Unique;
		}

		Step step = begin_step(StepKind::SolutionSummary);
		step.pivots = result.pivots;
		step.variables = result.variables;
		step.free_variables = result.free_variables;
		ErrorCode ec = render(step);
		if (!is_ok(ec))
				return ec;
		result_ = result;
		commit(step, Resume::Verdict, out);
		return ErrorCode::Ok;
}

ErrorCode StepEngine::on_verdict(Step* out) noexcept {
		const StepKind kind = (result_.kind == SolutionKind::Infinite) ? StepKind::InfiniteSolutions : StepKind::UniqueSolution;
		Step step = begin_step(kind);
		step.pivots = result_.pivots;
		step.variables = result_.variables;
		step.free_variables = result_.free_variables;
		ErrorCode ec = render(step);
		if (!is_ok(ec))
				return ec;
		commit(step, Resume::AnalysisDone, out);
		return ErrorCode::Ok;
}

ErrorCode StepEngine::on_final(StepKind kind, Step* out) noexcept {
		Step step = begin_step(kind);
		if (kind == StepKind::NoSolution) {
				step.row = result_.contradiction_row;
				step.value = last_.value;
		}
		ErrorCode ec = render(step);
		if (!is_ok(ec))
				return ec;
		commit(step, Resume::Done, out);
		return ErrorCode::Ok;
}

} // namespace rref_core
