#include "csp/frame.hpp"
#include <stdexcept>
#include <utility>

namespace csp {
MatPixelBuffer::MatPixelBuffer(cv::Mat bgra) : mat_(std::move(bgra)){
  if(!mat_.empty() && mat_.type() != CV_8UC4)
    throw std::invalid_argument("MatPixelBuffer expects CV_8UC4 (BGRA)");
}

bool MatPixelBuffer::lock_read(){
  ++locks_; ++total_locks_;
  return true;
}

void MatPixelBuffer::unlock_read(){
  if(locks_ > 0) --locks_;
}

const std::uint8_t* MatPixelBuffer::base_address() const{
  return mat_.empty() ? nullptr : mat_.ptr<std::uint8_t>(0);
}
}
