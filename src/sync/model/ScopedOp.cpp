#include "sync/model/ScopedOp.hpp"

using namespace ferry::sync::model;
using namespace std::chrono;

void ScopedOp::start() { begin = steady_clock::now(); }
void ScopedOp::stop() { end = steady_clock::now(); }

void ScopedOp::start(const uint64_t size_bytes) {
    this->size_bytes = size_bytes;
    start();
}

uint64_t ScopedOp::duration_ms() const {
    return duration_cast<milliseconds>(end - begin).count();
}
