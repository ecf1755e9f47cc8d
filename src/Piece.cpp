#include "Piece.inl"

#include <stdexcept>

template <size_t L>
Piece<L>::Piece(char nm, cells_t cells)
    : name{ nm }, base{ std::move(cells) }, canonical{ to_shape<L>(normalize(base)) } {
    if (base.empty())
        throw std::invalid_argument{ fmt::format("piece {} has no cells", name) };
    if (!canonical.connected())
        throw std::invalid_argument{ fmt::format("piece {} is not connected:\n{}", name, canonical) };
    if (canonical.size() != base.size())
        throw std::invalid_argument{ fmt::format("piece {} repeats a cell", name) };
    for (auto &o : orientations_of(base)) {
        auto sh = to_shape<L>(o);
        placements.push_back(Placement{ o, sh,
                coords_t{ static_cast<int>(sh.bottom()), static_cast<int>(sh.right()) } });
    }
}

template struct Piece<8>;
