#include "LabelledArray.hpp"
#include <stdexcept>
#include <algorithm>

namespace QWRAP {

namespace {

void checkPetsc(PetscErrorCode ierr, const char* call) {
    if (ierr) {
        throw std::runtime_error(std::string("PETSc error in ") + call +
                                 " (code " + std::to_string(static_cast<int>(ierr)) + ")");
    }
}

} // namespace

LabelledArray::LabelledArray() : data_(nullptr) {}

LabelledArray::LabelledArray(const std::string& name, const std::vector<double>& values,
                             const Attributes& attrs)
    : name_(name), attrs_(attrs), data_(nullptr) {
    PetscErrorCode ierr;

    ierr = VecCreateSeq(PETSC_COMM_SELF, static_cast<PetscInt>(values.size()), &data_);
    checkPetsc(ierr, "VecCreateSeq");

    if (!name_.empty()) {
        ierr = PetscObjectSetName((PetscObject)data_, name_.c_str());
        checkPetsc(ierr, "PetscObjectSetName");
    }

    PetscScalar* array;
    ierr = VecGetArray(data_, &array);
    checkPetsc(ierr, "VecGetArray");
    std::copy(values.begin(), values.end(), array);
    ierr = VecRestoreArray(data_, &array);
    checkPetsc(ierr, "VecRestoreArray");
}

LabelledArray::~LabelledArray() {
    if (data_) VecDestroy(&data_);
}

LabelledArray::LabelledArray(const LabelledArray& other)
    : name_(other.name_), attrs_(other.attrs_), data_(nullptr), units_(other.units_) {
    copyDataFrom(other.data_);
}

LabelledArray& LabelledArray::operator=(const LabelledArray& other) {
    if (this != &other) {
        LabelledArray copy(other);
        *this = std::move(copy);
    }
    return *this;
}

LabelledArray::LabelledArray(LabelledArray&& other) noexcept
    : name_(std::move(other.name_)), attrs_(std::move(other.attrs_)),
      data_(other.data_), units_(std::move(other.units_)) {
    other.data_ = nullptr;
}

LabelledArray& LabelledArray::operator=(LabelledArray&& other) noexcept {
    if (this != &other) {
        if (data_) VecDestroy(&data_);
        name_ = std::move(other.name_);
        attrs_ = std::move(other.attrs_);
        units_ = std::move(other.units_);
        data_ = other.data_;
        other.data_ = nullptr;
    }
    return *this;
}

void LabelledArray::copyDataFrom(Vec source) {
    if (!source) return;

    PetscErrorCode ierr;
    ierr = VecDuplicate(source, &data_);
    checkPetsc(ierr, "VecDuplicate");
    ierr = VecCopy(source, data_);
    checkPetsc(ierr, "VecCopy");
}

PetscInt LabelledArray::size() const {
    if (!data_) return 0;
    PetscInt n;
    checkPetsc(VecGetSize(data_, &n), "VecGetSize");
    return n;
}

std::vector<double> LabelledArray::values() const {
    std::vector<double> result;
    if (!data_) return result;

    PetscInt n = size();
    const PetscScalar* array;
    checkPetsc(VecGetArrayRead(data_, &array), "VecGetArrayRead");
    result.assign(array, array + n);
    checkPetsc(VecRestoreArrayRead(data_, &array), "VecRestoreArrayRead");
    return result;
}

std::optional<CompoundUnit> LabelledArray::inherentUnits(const UnitSystem& registry) const {
    if (units_) {
        return units_;
    }
    auto it = attrs_.find("units");
    if (it != attrs_.end()) {
        return registry.parseUnit(it->second);
    }
    return std::nullopt;
}

LabelledArray LabelledArray::quantify(const CompoundUnit& unit) const {
    LabelledArray result(*this);
    result.units_ = unit;
    result.attrs_.erase("units");
    return result;
}

LabelledArray LabelledArray::quantify(const UnitSystem& registry) const {
    if (units_) {
        return *this;
    }
    auto it = attrs_.find("units");
    CompoundUnit unit = (it != attrs_.end()) ? registry.parseUnit(it->second)
                                             : CompoundUnit::dimensionless();
    return quantify(unit);
}

LabelledArray LabelledArray::dequantify() const {
    LabelledArray result(*this);
    if (result.units_) {
        result.attrs_["units"] = result.units_->toString();
        result.units_.reset();
    }
    return result;
}

LabelledArray LabelledArray::to(const CompoundUnit& unit, const UnitSystem& registry) const {
    if (!units_) {
        throw std::runtime_error("Cannot convert labelled array '" + name_ +
                                 "' without explicit units");
    }

    double scale = 1.0;
    double shift = 0.0;
    registry.conversionCoefficients(*units_, unit, scale, shift);

    LabelledArray result(*this);
    if (result.data_) {
        checkPetsc(VecScale(result.data_, scale), "VecScale");
        if (shift != 0.0) {
            checkPetsc(VecShift(result.data_, shift), "VecShift");
        }
    }
    result.units_ = unit;
    return result;
}

} // namespace QWRAP
