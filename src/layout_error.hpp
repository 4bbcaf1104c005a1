#pragma once
/*
 * LayoutError
 *
 * Purpose: error codes returned by the layout engine (tree renderer, stacks,
 * workspace view). None means success.
 */

enum class LayoutError {
  None,
  NilRoot,
  NilWorkspace,
  PaneNotFound,
  IndexOutOfBounds,
  StackEmpty,
  CannotRemoveLastPane,
  NodeNotFound,
  InvalidNode
};

inline const char* layout_error_message(LayoutError e) {
  switch (e) {
    case LayoutError::None: return "ok";
    case LayoutError::NilRoot: return "root node is nil";
    case LayoutError::NilWorkspace: return "workspace is nil";
    case LayoutError::PaneNotFound: return "pane not found";
    case LayoutError::IndexOutOfBounds: return "index out of bounds";
    case LayoutError::StackEmpty: return "stack is empty";
    case LayoutError::CannotRemoveLastPane: return "cannot remove last pane from stack";
    case LayoutError::NodeNotFound: return "node not found";
    case LayoutError::InvalidNode: return "node is neither leaf, split nor stack";
  }
  return "unknown error";
}
