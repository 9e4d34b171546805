#pragma once
#include "color.hpp"
#include <array>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace csp {

/// Face slot for a center color: W->0(U) R->1(R) G->2(F) Y->3(D) O->4(L) B->5(B).
/// Unknown has no slot.
std::optional<int> face_index_for(DiscreteColor center);

/// U R F D L B for 0..5, '?' otherwise.
char face_letter(int face);

/// Six faces of nine stickers, all Unknown until scanned.
/// update() belongs to the single owner context; reads are safe from anywhere.
class CubeFaceSet {
public:
    using Observer = std::function<void(int face, const FaceReading& reading)>;

    CubeFaceSet();

    /// Replaces the stored reading; false (and no observer call) when identical.
    /// Throws std::invalid_argument for a face outside [0, 6).
    bool update(int face, const FaceReading& reading);

    FaceReading face(int face) const;
    std::array<FaceReading, kFaces> snapshot() const;

    bool is_complete() const;
    /// 54 chars in URFDLB face order, each sticker as its face letter.
    std::string to_facelet_string() const;

    void set_observer(Observer obs);
    std::size_t change_count() const;
    void reset();

private:
    mutable std::mutex mu_;
    std::array<FaceReading, kFaces> faces_;
    Observer observer_;
    std::size_t changes_{0};
};
}
