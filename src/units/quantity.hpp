// src/units/quantity.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace units {

/**
 * UnitError - Raised for unknown unit names and for operations that mix
 * dimensions (e.g. comparing a distance with a time).
 *
 * Always a configuration or programmer error: never caught and coerced.
 */
class UnitError : public std::runtime_error {
public:
    explicit UnitError(const std::string& what) : std::runtime_error(what) {}
};

enum class Dimension {
    Distance,
    Time
};

enum class Unit {
    Millimeter,
    Centimeter,
    Inch,
    Foot,
    Millisecond,
    Second
};

/**
 * UnitSystem - Preferred display units for distances.
 *
 * Carried explicitly in each bay configuration; there is no process-wide default.
 */
enum class UnitSystem {
    Metric,     // centimeters
    Imperial    // inches
};

Dimension dimension_of(Unit unit);
const char* to_string(Unit unit);
const char* to_string(UnitSystem system);

/**
 * parse_unit() - "cm", "Centimeters", "in", "ft", "s", ...
 * @throws UnitError if the name is not recognized
 */
Unit parse_unit(const std::string& name);

/**
 * parse_unit_system() - "metric" / "imperial"
 * @throws UnitError otherwise
 */
UnitSystem parse_unit_system(const std::string& name);

/**
 * Quantity - Scalar magnitude tagged with a physical unit
 *
 * The magnitude is stored normalized to the dimension's base unit
 * (centimeters for distance, seconds for time). The unit the value was
 * expressed in is kept for display and for the result unit of arithmetic.
 *
 * Quantities are immutable: every operation returns a new Quantity.
 *
 * Usage:
 *   units::Quantity stop(10.0, units::Unit::Centimeter);
 *   units::Quantity raw = units::Quantity::parse("2 ft");
 *   if (raw > stop) { ... }                      // compares in centimeters
 *   double in = raw.value_in(units::Unit::Inch); // 24.0
 */
class Quantity {
public:
    Quantity(double value, Unit unit);

    /**
     * @throws UnitError if unit is not a recognized unit name
     */
    Quantity(double value, const std::string& unit);

    /**
     * parse() - Parse "<number> <unit>" (whitespace optional: "12.5cm")
     * @throws UnitError on malformed input or unknown unit
     */
    static Quantity parse(const std::string& text);

    /**
     * convert() - Same quantity, expressed in another unit of the same dimension
     * @throws UnitError if target has a different dimension
     */
    Quantity convert(Unit target) const;

    /**
     * to_system() - Express distances in the unit system's display unit.
     * Time quantities are returned unchanged.
     */
    Quantity to_system(UnitSystem system) const;

    double value() const;
    double value_in(Unit target) const;
    double base_value() const { return base_; }

    Unit unit() const { return unit_; }
    Dimension dimension() const { return dimension_of(unit_); }

    bool same_dimension(const Quantity& other) const {
        return dimension() == other.dimension();
    }

    Quantity abs() const;

    std::string to_string(int precision = 2) const;

    // Arithmetic (same dimension only, result in the left operand's unit)
    Quantity operator+(const Quantity& rhs) const;
    Quantity operator-(const Quantity& rhs) const;
    Quantity operator-() const;
    Quantity operator*(double k) const;
    Quantity operator/(double k) const;

    // Comparisons on base magnitudes (same dimension only)
    bool operator<(const Quantity& rhs) const;
    bool operator<=(const Quantity& rhs) const;
    bool operator>(const Quantity& rhs) const;
    bool operator>=(const Quantity& rhs) const;
    bool operator==(const Quantity& rhs) const;
    bool operator!=(const Quantity& rhs) const;

private:
    struct BaseTag {};
    Quantity(BaseTag, double base, Unit unit) : base_(base), unit_(unit) {}

    void require_same_dimension(const Quantity& rhs, const char* op) const;

    double base_;   // magnitude in base unit (cm or s)
    Unit unit_;
};

inline Quantity operator*(double k, const Quantity& q) { return q * k; }

/**
 * ratio() - Dimensionless a / b
 * @throws UnitError if dimensions differ, std::domain_error if b is zero
 */
double ratio(const Quantity& a, const Quantity& b);

// Shorthands used throughout the bay code
inline Quantity cm(double v) { return Quantity(v, Unit::Centimeter); }
inline Quantity mm(double v) { return Quantity(v, Unit::Millimeter); }
inline Quantity inches(double v) { return Quantity(v, Unit::Inch); }
inline Quantity seconds(double v) { return Quantity(v, Unit::Second); }

} // namespace units
