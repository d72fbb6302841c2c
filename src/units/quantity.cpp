// src/units/quantity.cpp
#include "units/quantity.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace units {

namespace {

// Size of one unit expressed in the dimension's base unit.
double base_factor(Unit unit) {
    switch (unit) {
        case Unit::Millimeter:  return 0.1;
        case Unit::Centimeter:  return 1.0;
        case Unit::Inch:        return 2.54;
        case Unit::Foot:        return 30.48;
        case Unit::Millisecond: return 0.001;
        case Unit::Second:      return 1.0;
    }
    return 1.0;
}

std::string lower_trimmed(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;

    std::string out;
    out.reserve(e - b);
    for (size_t i = b; i < e; ++i) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(s[i]))));
    }
    return out;
}

} // namespace

Dimension dimension_of(Unit unit) {
    switch (unit) {
        case Unit::Millisecond:
        case Unit::Second:
            return Dimension::Time;
        default:
            return Dimension::Distance;
    }
}

const char* to_string(Unit unit) {
    switch (unit) {
        case Unit::Millimeter:  return "mm";
        case Unit::Centimeter:  return "cm";
        case Unit::Inch:        return "in";
        case Unit::Foot:        return "ft";
        case Unit::Millisecond: return "ms";
        case Unit::Second:      return "s";
    }
    return "?";
}

const char* to_string(UnitSystem system) {
    return system == UnitSystem::Imperial ? "imperial" : "metric";
}

Unit parse_unit(const std::string& name) {
    const std::string n = lower_trimmed(name);

    if (n == "mm" || n == "millimeter" || n == "millimeters" || n == "millimetre" || n == "millimetres")
        return Unit::Millimeter;
    if (n == "cm" || n == "centimeter" || n == "centimeters" || n == "centimetre" || n == "centimetres")
        return Unit::Centimeter;
    if (n == "in" || n == "inch" || n == "inches")
        return Unit::Inch;
    if (n == "ft" || n == "foot" || n == "feet")
        return Unit::Foot;
    if (n == "ms" || n == "millisecond" || n == "milliseconds")
        return Unit::Millisecond;
    if (n == "s" || n == "sec" || n == "second" || n == "seconds")
        return Unit::Second;

    throw UnitError("Unknown unit '" + name + "'");
}

UnitSystem parse_unit_system(const std::string& name) {
    const std::string n = lower_trimmed(name);
    if (n == "metric") return UnitSystem::Metric;
    if (n == "imperial") return UnitSystem::Imperial;
    throw UnitError("Unknown unit system '" + name + "' (expected 'metric' or 'imperial')");
}

// ============================================================================
// Construction
// ============================================================================

Quantity::Quantity(double value, Unit unit)
    : base_(value * base_factor(unit))
    , unit_(unit)
{}

Quantity::Quantity(double value, const std::string& unit)
    : Quantity(value, parse_unit(unit))
{}

Quantity Quantity::parse(const std::string& text) {
    const char* begin = text.c_str();
    char* end = nullptr;
    const double v = std::strtod(begin, &end);

    if (end == begin) {
        throw UnitError("Cannot parse quantity '" + text + "': missing magnitude");
    }
    if (!std::isfinite(v)) {
        throw UnitError("Cannot parse quantity '" + text + "': magnitude is not finite");
    }

    const std::string unit_part(end);
    if (lower_trimmed(unit_part).empty()) {
        throw UnitError("Cannot parse quantity '" + text + "': missing unit");
    }
    return Quantity(v, parse_unit(unit_part));
}

// ============================================================================
// Conversion
// ============================================================================

Quantity Quantity::convert(Unit target) const {
    if (dimension_of(target) != dimension()) {
        throw UnitError(std::string("Cannot convert ") + units::to_string(unit_) +
                        " to " + units::to_string(target));
    }
    return Quantity(BaseTag{}, base_, target);
}

Quantity Quantity::to_system(UnitSystem system) const {
    if (dimension() != Dimension::Distance) {
        return *this;
    }
    return convert(system == UnitSystem::Imperial ? Unit::Inch : Unit::Centimeter);
}

double Quantity::value() const {
    return base_ / base_factor(unit_);
}

double Quantity::value_in(Unit target) const {
    if (dimension_of(target) != dimension()) {
        throw UnitError(std::string("Cannot express ") + units::to_string(unit_) +
                        " in " + units::to_string(target));
    }
    return base_ / base_factor(target);
}

Quantity Quantity::abs() const {
    return Quantity(BaseTag{}, std::fabs(base_), unit_);
}

std::string Quantity::to_string(int precision) const {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f %s", precision, value(), units::to_string(unit_));
    return buf;
}

// ============================================================================
// Arithmetic
// ============================================================================

void Quantity::require_same_dimension(const Quantity& rhs, const char* op) const {
    if (!same_dimension(rhs)) {
        throw UnitError(std::string("Incompatible units for '") + op + "': " +
                        units::to_string(unit_) + " and " + units::to_string(rhs.unit_));
    }
}

Quantity Quantity::operator+(const Quantity& rhs) const {
    require_same_dimension(rhs, "+");
    return Quantity(BaseTag{}, base_ + rhs.base_, unit_);
}

Quantity Quantity::operator-(const Quantity& rhs) const {
    require_same_dimension(rhs, "-");
    return Quantity(BaseTag{}, base_ - rhs.base_, unit_);
}

Quantity Quantity::operator-() const {
    return Quantity(BaseTag{}, -base_, unit_);
}

Quantity Quantity::operator*(double k) const {
    return Quantity(BaseTag{}, base_ * k, unit_);
}

Quantity Quantity::operator/(double k) const {
    if (k == 0.0) {
        throw std::domain_error("Quantity divided by zero");
    }
    return Quantity(BaseTag{}, base_ / k, unit_);
}

double ratio(const Quantity& a, const Quantity& b) {
    if (!a.same_dimension(b)) {
        throw UnitError(std::string("Cannot take ratio of ") + to_string(a.unit()) +
                        " and " + to_string(b.unit()));
    }
    if (b.base_value() == 0.0) {
        throw std::domain_error("Quantity ratio with zero denominator");
    }
    return a.base_value() / b.base_value();
}

// ============================================================================
// Comparison
// ============================================================================

bool Quantity::operator<(const Quantity& rhs) const {
    require_same_dimension(rhs, "<");
    return base_ < rhs.base_;
}

bool Quantity::operator<=(const Quantity& rhs) const {
    require_same_dimension(rhs, "<=");
    return base_ <= rhs.base_;
}

bool Quantity::operator>(const Quantity& rhs) const {
    require_same_dimension(rhs, ">");
    return base_ > rhs.base_;
}

bool Quantity::operator>=(const Quantity& rhs) const {
    require_same_dimension(rhs, ">=");
    return base_ >= rhs.base_;
}

bool Quantity::operator==(const Quantity& rhs) const {
    require_same_dimension(rhs, "==");
    return base_ == rhs.base_;
}

bool Quantity::operator!=(const Quantity& rhs) const {
    require_same_dimension(rhs, "!=");
    return base_ != rhs.base_;
}

} // namespace units
