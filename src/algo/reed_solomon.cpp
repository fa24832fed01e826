// =============================================================================
// oligo-codec - Reed-Solomon FEC Coder Implementation
// =============================================================================
// Polynomials are stored highest degree first. Decoding follows the classic
// pipeline: syndromes -> Forney syndromes (erasures removed) ->
// Berlekamp-Massey error locator -> Chien search -> Forney magnitudes over
// the combined errata locator -> syndrome re-check.
// =============================================================================

#include "oligo/algo/reed_solomon.h"

#include <algorithm>
#include <array>

#include <fmt/format.h>

namespace oligo::algo {

namespace {

// =============================================================================
// GF(256) Arithmetic
// =============================================================================

constexpr unsigned kPrimitivePoly = 0x11D;
constexpr unsigned kFieldOrder = 255;

struct GaloisTables {
    std::array<std::uint8_t, 2 * kFieldOrder> exp{};
    std::array<std::uint8_t, 256> log{};
};

constexpr GaloisTables makeGaloisTables() noexcept {
    GaloisTables tables{};
    unsigned x = 1;
    for (unsigned i = 0; i < kFieldOrder; ++i) {
        tables.exp[i] = static_cast<std::uint8_t>(x);
        tables.log[x] = static_cast<std::uint8_t>(i);
        x <<= 1;
        if ((x & 0x100U) != 0) {
            x ^= kPrimitivePoly;
        }
    }
    for (unsigned i = kFieldOrder; i < 2 * kFieldOrder; ++i) {
        tables.exp[i] = tables.exp[i - kFieldOrder];
    }
    return tables;
}

constexpr GaloisTables kGf = makeGaloisTables();

using Poly = std::vector<std::uint8_t>;

std::uint8_t gfMul(std::uint8_t a, std::uint8_t b) noexcept {
    if (a == 0 || b == 0) {
        return 0;
    }
    return kGf.exp[kGf.log[a] + kGf.log[b]];
}

/// @brief a / b; b must be non-zero.
std::uint8_t gfDiv(std::uint8_t a, std::uint8_t b) noexcept {
    if (a == 0) {
        return 0;
    }
    return kGf.exp[(kGf.log[a] + kFieldOrder - kGf.log[b]) % kFieldOrder];
}

/// @brief alpha^power for any non-negative power.
std::uint8_t gfAlphaPow(std::size_t power) noexcept {
    return kGf.exp[power % kFieldOrder];
}

std::uint8_t gfInverse(std::uint8_t a) noexcept {
    return kGf.exp[kFieldOrder - kGf.log[a]];
}

Poly polyScale(const Poly& p, std::uint8_t x) {
    Poly result(p.size());
    for (std::size_t i = 0; i < p.size(); ++i) {
        result[i] = gfMul(p[i], x);
    }
    return result;
}

Poly polyAdd(const Poly& p, const Poly& q) {
    Poly result(std::max(p.size(), q.size()), 0);
    for (std::size_t i = 0; i < p.size(); ++i) {
        result[i + result.size() - p.size()] = p[i];
    }
    for (std::size_t i = 0; i < q.size(); ++i) {
        result[i + result.size() - q.size()] ^= q[i];
    }
    return result;
}

Poly polyMul(const Poly& p, const Poly& q) {
    Poly result(p.size() + q.size() - 1, 0);
    for (std::size_t j = 0; j < q.size(); ++j) {
        for (std::size_t i = 0; i < p.size(); ++i) {
            result[i + j] ^= gfMul(p[i], q[j]);
        }
    }
    return result;
}

std::uint8_t polyEval(std::span<const std::uint8_t> p, std::uint8_t x) noexcept {
    if (p.empty()) {
        return 0;
    }
    std::uint8_t y = p[0];
    for (std::size_t i = 1; i < p.size(); ++i) {
        y = static_cast<std::uint8_t>(gfMul(y, x) ^ p[i]);
    }
    return y;
}

/// @brief Remainder of dividend / divisor for a monic divisor.
Poly polyRemainder(const Poly& dividend, const Poly& divisor) {
    Poly work = dividend;
    const std::size_t divisorDegree = divisor.size() - 1;
    if (work.size() < divisor.size()) {
        return work;
    }
    for (std::size_t i = 0; i < work.size() - divisorDegree; ++i) {
        const std::uint8_t coef = work[i];
        if (coef == 0) {
            continue;
        }
        for (std::size_t j = 1; j < divisor.size(); ++j) {
            if (divisor[j] != 0) {
                work[i + j] ^= gfMul(divisor[j], coef);
            }
        }
    }
    return Poly(work.end() - static_cast<std::ptrdiff_t>(divisorDegree), work.end());
}

// =============================================================================
// Decoder Stages
// =============================================================================

/// @brief Syndromes S_0..S_{nsym-1}, prefixed with a zero coefficient.
Poly calcSyndromes(std::span<const std::uint8_t> codeword, std::size_t nsym) {
    Poly synd(nsym + 1, 0);
    for (std::size_t i = 0; i < nsym; ++i) {
        synd[i + 1] = polyEval(codeword, gfAlphaPow(i));
    }
    return synd;
}

/// @brief Syndromes with the contribution of known erasures removed.
Poly forneySyndromes(const Poly& synd,
                     const std::vector<std::size_t>& erasures,
                     std::size_t length) {
    Poly fsynd(synd.begin() + 1, synd.end());
    for (std::size_t pos : erasures) {
        const std::uint8_t x = gfAlphaPow(length - 1 - pos);
        for (std::size_t j = 0; j + 1 < fsynd.size(); ++j) {
            fsynd[j] = static_cast<std::uint8_t>(gfMul(fsynd[j], x) ^ fsynd[j + 1]);
        }
    }
    return fsynd;
}

/// @brief Berlekamp-Massey over the Forney syndromes.
Result<Poly> findErrorLocator(const Poly& fsynd, std::size_t nsym, std::size_t erasureCount) {
    Poly errLoc{1};
    Poly oldLoc{1};

    for (std::size_t i = 0; i < nsym - erasureCount; ++i) {
        const std::size_t k = i;
        std::uint8_t delta = fsynd[k];
        for (std::size_t j = 1; j < errLoc.size() && j <= k; ++j) {
            delta ^= gfMul(errLoc[errLoc.size() - 1 - j], fsynd[k - j]);
        }
        oldLoc.push_back(0);
        if (delta != 0) {
            if (oldLoc.size() > errLoc.size()) {
                Poly newLoc = polyScale(oldLoc, delta);
                oldLoc = polyScale(errLoc, gfInverse(delta));
                errLoc = std::move(newLoc);
            }
            errLoc = polyAdd(errLoc, polyScale(oldLoc, delta));
        }
    }

    auto firstNonZero = std::find_if(errLoc.begin(), errLoc.end(),
                                     [](std::uint8_t c) { return c != 0; });
    errLoc.erase(errLoc.begin(), firstNonZero);
    if (errLoc.empty()) {
        return makeError<Poly>(ErrorCode::kUncorrectableErrorBurst,
                               "error locator degenerated to zero");
    }

    const std::size_t errors = errLoc.size() - 1;
    if (errors * 2 + erasureCount > nsym) {
        return makeError<Poly>(
            ErrorCode::kUncorrectableErrorBurst,
            fmt::format("{} errors and {} erasures exceed correction capacity of {} symbols",
                        errors, erasureCount, nsym));
    }
    return errLoc;
}

/// @brief Chien search: codeword indices whose locator root vanishes.
Result<std::vector<std::size_t>> findErrorPositions(const Poly& errLoc, std::size_t length) {
    Poly reversed(errLoc.rbegin(), errLoc.rend());
    const std::size_t expected = errLoc.size() - 1;

    std::vector<std::size_t> positions;
    for (std::size_t i = 0; i < length; ++i) {
        if (polyEval(reversed, gfAlphaPow(i)) == 0) {
            positions.push_back(length - 1 - i);
        }
    }
    if (positions.size() != expected) {
        return makeError<std::vector<std::size_t>>(
            ErrorCode::kUncorrectableErrorBurst,
            fmt::format("error locator has degree {} but {} roots inside the codeword", expected,
                        positions.size()));
    }
    return positions;
}

/// @brief Forney algorithm: compute and apply errata magnitudes in place.
VoidResult correctErrata(std::vector<std::uint8_t>& codeword,
                         const Poly& synd,
                         const std::vector<std::size_t>& errataPositions) {
    const std::size_t length = codeword.size();

    std::vector<std::size_t> coefPositions;
    coefPositions.reserve(errataPositions.size());
    for (std::size_t pos : errataPositions) {
        coefPositions.push_back(length - 1 - pos);
    }

    // Errata locator: product of (1 + X_i x)
    Poly errataLoc{1};
    for (std::size_t coefPos : coefPositions) {
        errataLoc = polyMul(errataLoc, Poly{gfAlphaPow(coefPos), 1});
    }

    // Evaluator: (S(x) * Lambda(x)) mod x^(deg Lambda + 1), on reversed syndromes
    Poly syndReversed(synd.rbegin(), synd.rend());
    Poly divisor(errataLoc.size() + 1, 0);
    divisor[0] = 1;
    Poly evaluator = polyRemainder(polyMul(syndReversed, errataLoc), divisor);
    std::reverse(evaluator.begin(), evaluator.end());

    std::vector<std::uint8_t> locators;
    locators.reserve(coefPositions.size());
    for (std::size_t coefPos : coefPositions) {
        locators.push_back(gfAlphaPow(coefPos));
    }

    Poly evaluatorReversed(evaluator.rbegin(), evaluator.rend());
    for (std::size_t i = 0; i < locators.size(); ++i) {
        const std::uint8_t xi = locators[i];
        const std::uint8_t xiInv = gfInverse(xi);

        std::uint8_t locPrime = 1;
        for (std::size_t j = 0; j < locators.size(); ++j) {
            if (j != i) {
                locPrime = gfMul(locPrime, static_cast<std::uint8_t>(1 ^ gfMul(xiInv, locators[j])));
            }
        }
        if (locPrime == 0) {
            return makeVoidError(ErrorCode::kUncorrectableErrorBurst,
                                 "errata locator derivative vanished");
        }

        const std::uint8_t y = gfMul(xi, polyEval(evaluatorReversed, xiInv));
        codeword[errataPositions[i]] ^= gfDiv(y, locPrime);
    }
    return makeVoidSuccess();
}

bool allZero(std::span<const std::uint8_t> values) noexcept {
    return std::all_of(values.begin(), values.end(), [](std::uint8_t v) { return v == 0; });
}

}  // namespace

// =============================================================================
// ReedSolomonCoder Implementation
// =============================================================================

ReedSolomonCoder::ReedSolomonCoder(std::size_t nsym) : nsym_(nsym), generator_{1} {
    if (nsym_ >= kMaxCodewordLength) {
        throw ConfigurationError(
            ErrorCode::kConfigurationInvalid,
            fmt::format("{} parity symbols leave no room for data in a {}-symbol codeword", nsym_,
                        kMaxCodewordLength));
    }
    for (std::size_t i = 0; i < nsym_; ++i) {
        generator_ = polyMul(generator_, Poly{1, gfAlphaPow(i)});
    }
}

Result<std::vector<std::uint8_t>> ReedSolomonCoder::computeParity(
    std::span<const std::uint8_t> message) const {
    if (message.size() + nsym_ > kMaxCodewordLength) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kConfigurationInvalid,
            fmt::format("message of {} symbols plus {} parity exceeds codeword limit {}",
                        message.size(), nsym_, kMaxCodewordLength));
    }
    if (nsym_ == 0) {
        return std::vector<std::uint8_t>{};
    }

    // Synthetic division of message * x^nsym by the generator
    std::vector<std::uint8_t> work(message.size() + nsym_, 0);
    std::copy(message.begin(), message.end(), work.begin());
    for (std::size_t i = 0; i < message.size(); ++i) {
        const std::uint8_t coef = work[i];
        if (coef == 0) {
            continue;
        }
        for (std::size_t j = 1; j < generator_.size(); ++j) {
            work[i + j] ^= gfMul(generator_[j], coef);
        }
    }
    return std::vector<std::uint8_t>(work.end() - static_cast<std::ptrdiff_t>(nsym_), work.end());
}

Result<std::vector<std::uint8_t>> ReedSolomonCoder::encode(
    std::span<const std::uint8_t> message) const {
    auto parity = computeParity(message);
    if (!parity) {
        return makeError<std::vector<std::uint8_t>>(parity.error());
    }
    std::vector<std::uint8_t> codeword(message.begin(), message.end());
    codeword.insert(codeword.end(), parity->begin(), parity->end());
    return codeword;
}

Result<RsDecodeResult> ReedSolomonCoder::decode(std::span<const std::uint8_t> codeword,
                                                std::span<const std::size_t> erasures) const {
    if (codeword.size() > kMaxCodewordLength) {
        return makeError<RsDecodeResult>(
            ErrorCode::kFormatError,
            fmt::format("codeword of {} symbols exceeds limit {}", codeword.size(),
                        kMaxCodewordLength));
    }
    if (codeword.size() < nsym_) {
        return makeError<RsDecodeResult>(
            ErrorCode::kFormatError,
            fmt::format("codeword of {} symbols is shorter than its {} parity symbols",
                        codeword.size(), nsym_));
    }

    std::vector<std::size_t> erasePositions(erasures.begin(), erasures.end());
    std::sort(erasePositions.begin(), erasePositions.end());
    erasePositions.erase(std::unique(erasePositions.begin(), erasePositions.end()),
                         erasePositions.end());
    if (!erasePositions.empty() && erasePositions.back() >= codeword.size()) {
        return makeError<RsDecodeResult>(
            ErrorCode::kFormatError,
            fmt::format("erasure position {} outside codeword of {} symbols",
                        erasePositions.back(), codeword.size()));
    }

    const std::size_t messageLength = codeword.size() - nsym_;
    RsDecodeResult result;

    if (nsym_ == 0) {
        if (!erasePositions.empty()) {
            return makeError<RsDecodeResult>(
                ErrorCode::kUncorrectableErrorBurst,
                fmt::format("{} erasures cannot be filled without parity", erasePositions.size()));
        }
        result.message.assign(codeword.begin(), codeword.end());
        return result;
    }

    if (erasePositions.size() > nsym_) {
        return makeError<RsDecodeResult>(
            ErrorCode::kUncorrectableErrorBurst,
            fmt::format("{} erasures exceed correction capacity of {} symbols",
                        erasePositions.size(), nsym_));
    }

    std::vector<std::uint8_t> work(codeword.begin(), codeword.end());
    for (std::size_t pos : erasePositions) {
        work[pos] = 0;
    }

    Poly synd = calcSyndromes(work, nsym_);
    if (allZero(synd)) {
        result.message.assign(work.begin(), work.begin() + static_cast<std::ptrdiff_t>(messageLength));
        result.filledErasures = erasePositions.size();
        return result;
    }

    Poly fsynd = forneySyndromes(synd, erasePositions, work.size());
    auto errLoc = findErrorLocator(fsynd, nsym_, erasePositions.size());
    if (!errLoc) {
        return makeError<RsDecodeResult>(errLoc.error());
    }

    auto errorPositions = findErrorPositions(*errLoc, work.size());
    if (!errorPositions) {
        return makeError<RsDecodeResult>(errorPositions.error());
    }

    std::vector<std::size_t> errataPositions = erasePositions;
    errataPositions.insert(errataPositions.end(), errorPositions->begin(), errorPositions->end());

    if (auto corrected = correctErrata(work, synd, errataPositions); !corrected) {
        return makeError<RsDecodeResult>(corrected.error());
    }

    if (!allZero(calcSyndromes(work, nsym_))) {
        return makeError<RsDecodeResult>(ErrorCode::kUncorrectableErrorBurst,
                                         "residual syndrome after correction");
    }

    result.message.assign(work.begin(), work.begin() + static_cast<std::ptrdiff_t>(messageLength));
    result.correctedErrors = errorPositions->size();
    result.filledErasures = erasePositions.size();
    return result;
}

}  // namespace oligo::algo
