#include "rref_core/row_ops.hpp"

#include "rref_core/writer.hpp"

namespace rref_core {

ErrorCode row_op_apply(Matrix& m, const RowOp& op) noexcept {
		switch (op.kind) {
		case RowOpKind::Swap:
				return m.swap_rows(op.target_row, op.source_row);
		case RowOpKind::Scale:
				return m.scale_row(op.target_row, op.scalar);
		case RowOpKind::AddMul:
				return m.add_scaled_row(op.target_row, op.source_row, op.scalar);
		}
		return ErrorCode::Internal;
}

ErrorCode row_op_caption(const RowOp& op, char* out, std::size_t cap) noexcept {
		if (!out || cap == 0)
				return ErrorCode::BufferTooSmall;
		out[0] = '\0';

		Writer w{out, cap, 0};

		switch (op.kind) {
		case RowOpKind::Swap: {
				ErrorCode ec = w.append("$R_{");
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(op.target_row);
				if (!is_ok(ec))
						return ec;
				ec = w.append("} \\leftrightarrow R_{");
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(op.source_row);
				if (!is_ok(ec))
						return ec;
				return w.append("}$");
		}
		case RowOpKind::Scale: {
				ErrorCode ec = w.append("$R_{");
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(op.target_row);
				if (!is_ok(ec))
						return ec;
				ec = w.append("} \\leftarrow (");
				if (!is_ok(ec))
						return ec;
				ec = w.append_f64(op.scalar);
				if (!is_ok(ec))
						return ec;
				ec = w.append(") R_{");
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(op.target_row);
				if (!is_ok(ec))
						return ec;
				return w.append("}$");
		}
		case RowOpKind::AddMul: {
				ErrorCode ec = w.append("$R_{");
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(op.target_row);
				if (!is_ok(ec))
						return ec;
				ec = w.append("} \\leftarrow R_{");
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(op.target_row);
				if (!is_ok(ec))
						return ec;
				ec = w.append("} + (");
				if (!is_ok(ec))
						return ec;
				ec = w.append_f64(op.scalar);
				if (!is_ok(ec))
						return ec;
				ec = w.append(") R_{");
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(op.source_row);
				if (!is_ok(ec))
						return ec;
				return w.append("}$");
		}
		}
		return ErrorCode::Internal;
}

} // namespace rref_core
