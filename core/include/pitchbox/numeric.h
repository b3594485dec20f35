#pragma once
#include "value.h"

namespace pitchbox::script {

// numpy subset bound as `np`: array construction, elementwise math and
// reductions over lists, arrays and Series.
Value make_numpy_module();
// pandas subset bound as `pd`: DataFrame, Series, isna/notna, to_numeric.
Value make_pandas_module();
// math module (scalar functions and constants).
Value make_math_module();

} // namespace pitchbox::script
