#include "engine/series/elementwise.hpp"

#include "engine/core/errors.hpp"

#include <sstream>

namespace rowshade {

namespace {

template <class It>
BroadcastShape resolve_range(const char* op, It first, It last) {
  BroadcastShape shape;
  bool sized = false;
  std::size_t pos = 0;

  for (; first != last; ++first) {
    const Values* v = *first;
    ++pos;
    if (v->is_scalar()) continue;

    if (!sized) {
      shape.size = v->size();
      sized = true;
    } else if (v->size() != shape.size) {
      std::ostringstream oss;
      oss << (op ? op : "elementwise") << ": argument " << pos << " has length " << v->size()
          << ", expected " << shape.size;
      throw ShapeError(oss.str());
    }

    if (v->is_series()) {
      if (shape.labels == nullptr) {
        shape.labels = &v->series();
      } else if (!shape.labels->same_index(v->series())) {
        std::ostringstream oss;
        oss << (op ? op : "elementwise") << ": argument " << pos
            << " is a series with a different index";
        throw ShapeError(oss.str());
      }
    }

    if (static_cast<int>(v->kind()) > static_cast<int>(shape.kind)) {
      shape.kind = v->kind();
    }
  }

  return shape;
}

} // namespace

BroadcastShape resolve_shape(const char* op, std::initializer_list<const Values*> args) {
  return resolve_range(op, args.begin(), args.end());
}

BroadcastShape resolve_shape(const char* op, const std::vector<const Values*>& args) {
  return resolve_range(op, args.begin(), args.end());
}

} // namespace rowshade
