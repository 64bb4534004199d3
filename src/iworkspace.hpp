#pragma once
/*
 * IWorkspace
 *
 * Purpose: abstract the editor's outward side effects (writing the diagram
 * and its ASCII snapshot, copying to the system clipboard).
 * Contract: best effort; report through msg and return false, never throw.
 */
#include <string>
#include "diagram.hpp"

class IWorkspace {
public:
  virtual ~IWorkspace() = default;
  virtual bool save(const Diagram& d, const std::string& ascii, std::string& msg) = 0;
  virtual bool copy_text(const std::string& ascii, std::string& msg) = 0;
};
