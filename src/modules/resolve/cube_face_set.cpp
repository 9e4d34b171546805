#include "csp/face_set.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace csp {
namespace {
// indexed by DiscreteColor; -1 = no slot
constexpr int kFaceForColor[kColorCount] = {
  /*White*/ 0, /*Yellow*/ 3, /*Red*/ 1, /*Orange*/ 4, /*Blue*/ 5, /*Green*/ 2, /*Unknown*/ -1};
constexpr char kFaceLetters[kFaces] = {'U','R','F','D','L','B'};
}

std::optional<int> face_index_for(DiscreteColor center){
  const auto i = static_cast<std::size_t>(center);
  if(i >= kColorCount || kFaceForColor[i] < 0) return std::nullopt;
  return kFaceForColor[i];
}

char face_letter(int face){
  return (face >= 0 && face < int(kFaces)) ? kFaceLetters[face] : '?';
}

CubeFaceSet::CubeFaceSet(){ faces_.fill(unknown_reading()); }

bool CubeFaceSet::update(int face, const FaceReading& reading){
  if(face < 0 || face >= int(kFaces))
    throw std::invalid_argument("face index out of range: " + std::to_string(face));
  Observer obs;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if(faces_[face] == reading) return false;
    faces_[face] = reading;
    ++changes_;
    obs = observer_;
  }
  if(obs) obs(face, reading);
  return true;
}

FaceReading CubeFaceSet::face(int face) const{
  if(face < 0 || face >= int(kFaces))
    throw std::invalid_argument("face index out of range: " + std::to_string(face));
  std::lock_guard<std::mutex> lk(mu_);
  return faces_[face];
}

std::array<FaceReading, kFaces> CubeFaceSet::snapshot() const{
  std::lock_guard<std::mutex> lk(mu_);
  return faces_;
}

bool CubeFaceSet::is_complete() const{
  std::lock_guard<std::mutex> lk(mu_);
  for(auto& f : faces_)
    for(auto c : f) if(c == DiscreteColor::Unknown) return false;
  return true;
}

std::string CubeFaceSet::to_facelet_string() const{
  const auto faces = snapshot();
  std::string s; s.reserve(kFaces * kStickers);
  for(auto& f : faces)
    for(auto c : f){
      auto slot = face_index_for(c);
      s.push_back(slot ? face_letter(*slot) : '?');
    }
  return s;
}

void CubeFaceSet::set_observer(Observer obs){
  std::lock_guard<std::mutex> lk(mu_);
  observer_ = std::move(obs);
}

std::size_t CubeFaceSet::change_count() const{
  std::lock_guard<std::mutex> lk(mu_);
  return changes_;
}

void CubeFaceSet::reset(){
  std::lock_guard<std::mutex> lk(mu_);
  faces_.fill(unknown_reading());
}
}
