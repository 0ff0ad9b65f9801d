#pragma once

#include <type_traits>

// Annotation form used when a caller does not name one explicitly.
//   0 - key/value tokens: meta<R"(key="value", ...)">  (default)
//   1 - legacy single labels: label<"text">
#ifndef STRUCTYPE_USE_LEGACY_LABELS
#define STRUCTYPE_USE_LEGACY_LABELS 0
#endif

namespace StrucType {

namespace form {

struct KeyValue {};
struct Label {};

} // namespace form

#if STRUCTYPE_USE_LEGACY_LABELS
using DefaultForm = form::Label;
#else
using DefaultForm = form::KeyValue;
#endif

template<class F>
concept AnnotationForm = std::is_same_v<F, form::KeyValue> || std::is_same_v<F, form::Label>;

} // namespace StrucType
