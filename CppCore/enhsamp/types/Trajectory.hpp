#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Definition of the native Configuration and Trajectory types.
 *
 * A configuration is a flat vector of coordinates. A trajectory stores a
 * time-ordered sequence of configurations of one fixed dimension as a
 * lightweight row-major matrix, one frame per row.
 */

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace enhsamp {
namespace types {

/**
 * @typedef Configuration
 * @brief Coordinates of the system at one instant.
 */
using Configuration = std::vector<double>;

/**
 * @class Trajectory
 * @brief A row-major frames-by-dimension matrix of configurations.
 */
class Trajectory {
public:
  /**
   * @brief Default constructor.
   */
  Trajectory() : m_frames(0), m_dims(0) {}

  /**
   * @brief Constructor for an empty trajectory of fixed dimension.
   * @param dims  Number of coordinates per frame.
   */
  explicit Trajectory(size_t dims) : m_frames(0), m_dims(dims) {}

  /**
   * @brief Constructor for a trajectory with preallocated frames.
   * @param frames  Number of frames.
   * @param dims    Number of coordinates per frame.
   */
  Trajectory(size_t frames, size_t dims)
      : m_frames(frames), m_dims(dims), m_data(frames * dims, 0.0) {}

  /**
   * @brief Constructor for list initialization, one inner list per frame.
   * @param list  The nested initializer list.
   */
  Trajectory(std::initializer_list<std::initializer_list<double>> list)
      : m_frames(list.size()),
        m_dims(list.size() == 0 ? 0 : list.begin()->size()),
        m_data(m_frames * m_dims) {
    size_t rowIdx = 0;
    for (const auto &rowList : list) {
      if (rowList.size() != m_dims) {
        throw std::runtime_error("Ragged frames in trajectory initializer");
      }
      std::copy(rowList.begin(), rowList.end(),
                m_data.begin() + rowIdx * m_dims);
      ++rowIdx;
    }
  }

  /**
   * @brief Appends a frame at the end of the trajectory.
   * @param conf  The configuration to store.
   * @return Void.
   */
  void append(const Configuration &conf) {
    if (m_frames == 0 && m_dims == 0) {
      m_dims = conf.size();
    }
    if (conf.size() != m_dims) {
      throw std::runtime_error("Frame dimension does not match trajectory");
    }
    m_data.insert(m_data.end(), conf.begin(), conf.end());
    ++m_frames;
  }

  /**
   * @brief Access element for mutation.
   * @param frame  Frame index.
   * @param dim    Coordinate index.
   * @return Reference to the element.
   */
  double &operator()(size_t frame, size_t dim) {
    return m_data[frame * m_dims + dim];
  }

  /**
   * @brief Access element for reading.
   * @param frame  Frame index.
   * @param dim    Coordinate index.
   * @return Const reference to the element.
   */
  const double &operator()(size_t frame, size_t dim) const {
    return m_data[frame * m_dims + dim];
  }

  /**
   * @brief Copies one frame out of the trajectory.
   * @param idx  Frame index.
   * @return The configuration stored at @a idx.
   */
  Configuration frame(size_t idx) const {
    if (idx >= m_frames) {
      throw std::runtime_error("Frame index out of range");
    }
    auto first = m_data.begin() + idx * m_dims;
    return Configuration(first, first + m_dims);
  }

  /**
   * @brief Copies the first frame.
   * @return The initial configuration.
   */
  Configuration front() const { return frame(0); }

  /**
   * @brief Copies the last frame.
   * @return The final configuration.
   */
  Configuration back() const {
    if (m_frames == 0) {
      throw std::runtime_error("Empty trajectory has no last frame");
    }
    return frame(m_frames - 1);
  }

  /**
   * @brief Builds the time-reversed trajectory.
   * @return A copy with frames in reverse order.
   */
  Trajectory reversed() const {
    Trajectory result(m_frames, m_dims);
    for (size_t i = 0; i < m_frames; ++i) {
      std::copy(m_data.begin() + i * m_dims, m_data.begin() + (i + 1) * m_dims,
                result.m_data.begin() + (m_frames - 1 - i) * m_dims);
    }
    return result;
  }

  /**
   * @brief Appends the frames of another trajectory, skipping a prefix.
   * @param other  The trajectory to take frames from.
   * @param skip   Number of leading frames of @a other to drop.
   * @return Void.
   */
  void extend(const Trajectory &other, size_t skip = 0) {
    if (skip >= other.m_frames) {
      return;
    }
    if (m_frames == 0 && m_dims == 0) {
      m_dims = other.m_dims;
    }
    if (other.m_dims != m_dims) {
      throw std::runtime_error("Cannot join trajectories of different dimension");
    }
    m_data.insert(m_data.end(), other.m_data.begin() + skip * m_dims,
                  other.m_data.end());
    m_frames += other.m_frames - skip;
  }

  /**
   * @brief Fetches the number of frames.
   * @return Frame count.
   */
  size_t frames() const { return m_frames; }

  /**
   * @brief Fetches the dimension of each frame.
   * @return Coordinate count.
   */
  size_t dims() const { return m_dims; }

  /**
   * @brief Fetches the total number of elements.
   * @return Size of the underlying data vector.
   */
  size_t size() const { return m_frames * m_dims; }

  /**
   * @brief Checks for the absence of frames.
   * @return True when no frame is stored.
   */
  bool empty() const { return m_frames == 0; }

  /**
   * @brief Fetches a pointer to the raw data for mutation.
   * @return Raw pointer to memory.
   */
  double *data() { return m_data.data(); }

  /**
   * @brief Fetches a pointer to the raw data for reading.
   * @return Const raw pointer to memory.
   */
  const double *data() const { return m_data.data(); }

  bool operator==(const Trajectory &other) const {
    return m_frames == other.m_frames && m_dims == other.m_dims &&
           m_data == other.m_data;
  }

  /**
   * @brief Overload for stream insertion.
   * @param os  The output stream.
   * @param traj  The trajectory to print.
   * @return Reference to the output stream.
   */
  friend std::ostream &operator<<(std::ostream &os, const Trajectory &traj) {
    std::ios oldState(nullptr);
    oldState.copyfmt(os);
    for (size_t i = 0; i < traj.m_frames; ++i) {
      for (size_t j = 0; j < traj.m_dims; ++j) {
        double value = traj(i, j);
        if (std::abs(value) < 0.001) {
          os << std::scientific << std::setprecision(5);
        } else {
          os << std::fixed << std::setprecision(5);
        }
        os << std::setw(12) << value << ' ';
      }
      os << '\n';
    }
    os.copyfmt(oldState);
    return os;
  }

private:
  size_t m_frames; //!< The number of stored frames.
  size_t m_dims;   //!< The number of coordinates per frame.
  std::vector<double>
      m_data; //!< The underlying flat container for row-major data.
};

} // namespace types
} // namespace enhsamp
